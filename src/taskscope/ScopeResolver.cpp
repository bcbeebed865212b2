/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ScopeResolver.h"
#include "TaskStore.h"

#include <QPair>
#include <QQueue>
#include <QSet>

namespace Taskscope
{

namespace
{
ResolvedScope invalid(const QString &message)
{
    ResolvedScope result;
    result.status = Status(ErrorCode::ScopeInvalid, message);
    return result;
}
}

ResolvedScope ScopeResolver::resolve(const TaskStore &store, const ScopeDeclaration &scope)
{
    QStringList ids;

    if (scope.type == ScopeType::Custom) {
        if (scope.taskIds.isEmpty()) {
            return invalid(QStringLiteral("custom scope lists no tasks"));
        }
        for (const QString &id : scope.taskIds) {
            if (!store.contains(id)) {
                return invalid(QStringLiteral("custom scope references unknown task %1").arg(id));
            }
            if (!ids.contains(id)) {
                ids.append(id);
            }
        }
    } else {
        if (scope.rootTaskId.isEmpty()) {
            return invalid(QStringLiteral("%1 scope needs a root task").arg(ScopeDeclaration::typeToString(scope.type)));
        }
        if (!store.contains(scope.rootTaskId)) {
            return invalid(QStringLiteral("root task %1 not found").arg(scope.rootTaskId));
        }

        switch (scope.type) {
        case ScopeType::Task:
            ids.append(scope.rootTaskId);
            break;
        case ScopeType::TaskGroup:
            ids.append(scope.rootTaskId);
            ids.append(store.childrenOf(scope.rootTaskId));
            break;
        case ScopeType::Subtree:
        case ScopeType::Epic:
            ids = descendants(scope.rootTaskId, store.childIndex(), scope.maxDepth);
            break;
        case ScopeType::EpicPhase: {
            if (scope.phaseFilter.isEmpty()) {
                return invalid(QStringLiteral("epicPhase scope needs a phase filter"));
            }
            const QStringList subtree = descendants(scope.rootTaskId, store.childIndex(), scope.maxDepth);
            for (const QString &id : subtree) {
                const Task *task = store.task(id);
                if (task && task->phase == scope.phaseFilter) {
                    ids.append(id);
                }
            }
            break;
        }
        case ScopeType::Custom:
            break;
        }
    }

    for (const QString &excluded : scope.excludeTaskIds) {
        ids.removeAll(excluded);
    }

    if (ids.isEmpty()) {
        return invalid(QStringLiteral("scope resolves to no tasks"));
    }

    ResolvedScope result;
    result.taskIds = ids;
    return result;
}

QStringList ScopeResolver::descendants(const QString &rootId, const QHash<QString, QStringList> &children, int maxDepth)
{
    QStringList ids;
    QSet<QString> visited;
    QQueue<QPair<QString, int>> queue;

    queue.enqueue(qMakePair(rootId, 0));
    visited.insert(rootId);

    while (!queue.isEmpty()) {
        const QPair<QString, int> current = queue.dequeue();
        ids.append(current.first);

        if (current.second >= maxDepth) {
            continue;
        }
        const QStringList next = children.value(current.first);
        for (const QString &child : next) {
            if (visited.contains(child)) {
                continue;
            }
            visited.insert(child);
            queue.enqueue(qMakePair(child, current.second + 1));
        }
    }

    return ids;
}

} // namespace Taskscope

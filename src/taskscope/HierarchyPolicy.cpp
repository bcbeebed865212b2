/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HierarchyPolicy.h"
#include "TaskStore.h"

#include <QSet>

namespace Taskscope
{

Status HierarchyPolicy::canAddChild(const QString &parentId, const TaskStore &store, const HierarchyLimits &limits)
{
    if (parentId.isEmpty()) {
        return Status::ok();
    }

    if (!store.contains(parentId)) {
        return Status(ErrorCode::ParentNotFound, QStringLiteral("parent task %1 not found").arg(parentId));
    }

    const int parentDepth = depthOf(parentId, store);
    if (parentDepth < 0) {
        return Status(ErrorCode::DepthExceeded, QStringLiteral("parent chain of %1 is circular or broken").arg(parentId));
    }
    if (parentDepth + 1 >= limits.maxDepth) {
        return Status(ErrorCode::DepthExceeded,
                      QStringLiteral("a child of %1 would be at depth %2, limit is %3").arg(parentId).arg(parentDepth + 1).arg(limits.maxDepth));
    }

    if (limits.maxSiblings > 0) {
        const int siblings = siblingCount(parentId, store, limits.countDoneInLimit);
        if (siblings >= limits.maxSiblings) {
            return Status(ErrorCode::SiblingLimit, QStringLiteral("%1 already has %2 children, limit is %3").arg(parentId).arg(siblings).arg(limits.maxSiblings));
        }
    }

    return Status::ok();
}

int HierarchyPolicy::depthOf(const QString &taskId, const TaskStore &store)
{
    QSet<QString> seen;
    int depth = 0;

    const Task *current = store.task(taskId);
    while (current && current->hasParent()) {
        if (seen.contains(current->id)) {
            return -1;
        }
        seen.insert(current->id);
        current = store.task(current->parentId);
        if (!current) {
            return -1;
        }
        ++depth;
    }

    return current ? depth : -1;
}

int HierarchyPolicy::siblingCount(const QString &parentId, const TaskStore &store, bool countDone)
{
    int count = 0;
    for (const Task &task : store.tasks()) {
        if (task.parentId != parentId) {
            continue;
        }
        if (!countDone && task.status == TaskStatus::Done) {
            continue;
        }
        ++count;
    }
    return count;
}

} // namespace Taskscope

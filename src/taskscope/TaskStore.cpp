/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TaskStore.h"
#include "Checksum.h"

#include <QJsonArray>
#include <QRegularExpression>

namespace Taskscope
{

TaskStore TaskStore::createEmpty(const QString &projectName)
{
    TaskStore store;
    store.m_root[QStringLiteral("version")] = QStringLiteral("1.0.0");
    store.m_root[QStringLiteral("project")] = projectName;
    store.m_meta[QStringLiteral("activeSessionCount")] = 0;
    store.m_meta[QStringLiteral("multiSessionEnabled")] = false;
    store.touch(QDateTime::currentDateTimeUtc());
    return store;
}

Status TaskStore::fromJson(const QJsonDocument &doc, TaskStore *store)
{
    if (!doc.isObject()) {
        return Status(ErrorCode::ParseFailed, QStringLiteral("task store is not a JSON object"));
    }

    const QJsonObject root = doc.object();
    const QJsonValue tasksValue = root.value(QStringLiteral("tasks"));
    if (!tasksValue.isArray()) {
        return Status(ErrorCode::ParseFailed, QStringLiteral("task store has no \"tasks\" array"));
    }

    TaskStore result;
    result.m_root = root;
    result.m_root.remove(QStringLiteral("tasks"));
    result.m_root.remove(QStringLiteral("_meta"));
    result.m_meta = root.value(QStringLiteral("_meta")).toObject();

    const QJsonArray tasks = tasksValue.toArray();
    result.m_tasks.reserve(tasks.size());
    for (const QJsonValue &value : tasks) {
        if (!value.isObject()) {
            return Status(ErrorCode::ParseFailed, QStringLiteral("task entry is not an object"));
        }
        const QJsonObject obj = value.toObject();
        TaskStatus status;
        const QString statusValue = obj.value(QStringLiteral("status")).toString();
        if (!Task::statusFromString(statusValue, &status)) {
            return Status(ErrorCode::ParseFailed, QStringLiteral("task %1 has unknown status \"%2\"").arg(obj.value(QStringLiteral("id")).toString(), statusValue));
        }
        const Task task = Task::fromJson(obj);
        result.m_index.insert(task.id, result.m_tasks.size());
        result.m_tasks.append(task);
    }

    *store = result;
    return Status::ok();
}

QJsonDocument TaskStore::toJson() const
{
    QJsonArray tasks;
    for (const Task &task : m_tasks) {
        tasks.append(task.toJson());
    }

    QJsonObject meta = m_meta;
    meta[QStringLiteral("checksum")] = Checksum::ofCollection(tasks);

    QJsonObject root = m_root;
    root[QStringLiteral("_meta")] = meta;
    root[QStringLiteral("tasks")] = tasks;
    return QJsonDocument(root);
}

const Task *TaskStore::task(const QString &id) const
{
    auto it = m_index.constFind(id);
    if (it == m_index.constEnd()) {
        return nullptr;
    }
    return &m_tasks.at(it.value());
}

QStringList TaskStore::childrenOf(const QString &parentId) const
{
    QStringList children;
    for (const Task &task : m_tasks) {
        if (task.parentId == parentId && !parentId.isEmpty()) {
            children.append(task.id);
        }
    }
    return children;
}

QHash<QString, QStringList> TaskStore::childIndex() const
{
    QHash<QString, QStringList> index;
    for (const Task &task : m_tasks) {
        if (task.hasParent()) {
            index[task.parentId].append(task.id);
        }
    }
    return index;
}

bool TaskStore::setStatus(const QString &id, TaskStatus status, const QDateTime &now)
{
    auto it = m_index.constFind(id);
    if (it == m_index.constEnd()) {
        return false;
    }
    Task &task = m_tasks[it.value()];
    if (task.status != status) {
        task.status = status;
        task.updatedAt = now;
    }
    return true;
}

Status TaskStore::appendTask(const Task &task)
{
    if (!task.isValid()) {
        return Status(ErrorCode::InvalidArgument, QStringLiteral("task has no id"));
    }
    if (m_index.contains(task.id)) {
        return Status(ErrorCode::DuplicateTaskId, QStringLiteral("task %1 already exists").arg(task.id));
    }

    m_index.insert(task.id, m_tasks.size());
    m_tasks.append(task);

    const int issued = numericId(task.id);
    if (issued > numericId(m_meta.value(QStringLiteral("lastIssuedId")).toString())) {
        m_meta[QStringLiteral("lastIssuedId")] = task.id;
    }
    return Status::ok();
}

QString TaskStore::nextTaskId() const
{
    int highest = numericId(m_meta.value(QStringLiteral("lastIssuedId")).toString());
    for (const Task &task : m_tasks) {
        highest = qMax(highest, numericId(task.id));
    }
    return QStringLiteral("T%1").arg(highest + 1, 3, 10, QLatin1Char('0'));
}

int TaskStore::activeSessionCount() const
{
    return m_meta.value(QStringLiteral("activeSessionCount")).toInt(0);
}

void TaskStore::setActiveSessionCount(int count)
{
    m_meta[QStringLiteral("activeSessionCount")] = qMax(0, count);
}

bool TaskStore::multiSessionEnabled() const
{
    return m_meta.value(QStringLiteral("multiSessionEnabled")).toBool(false);
}

void TaskStore::setMultiSessionEnabled(bool enabled)
{
    m_meta[QStringLiteral("multiSessionEnabled")] = enabled;
}

QString TaskStore::storedChecksum() const
{
    return m_meta.value(QStringLiteral("checksum")).toString();
}

QString TaskStore::computeChecksum() const
{
    QJsonArray tasks;
    for (const Task &task : m_tasks) {
        tasks.append(task.toJson());
    }
    return Checksum::ofCollection(tasks);
}

QDateTime TaskStore::lastModified() const
{
    return parseTimestamp(m_meta.value(QStringLiteral("lastModified")).toString());
}

void TaskStore::touch(const QDateTime &now)
{
    m_meta[QStringLiteral("lastModified")] = isoTimestamp(now);
}

int TaskStore::numericId(const QString &id)
{
    static const QRegularExpression idPattern(QStringLiteral("^T(\\d+)$"));
    const QRegularExpressionMatch match = idPattern.match(id);
    if (!match.hasMatch()) {
        return 0;
    }
    return match.captured(1).toInt();
}

} // namespace Taskscope

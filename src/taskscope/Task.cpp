/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Task.h"

namespace Taskscope
{

QJsonObject Task::toJson() const
{
    QJsonObject obj = extra;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("title")] = title;
    obj[QStringLiteral("parentId")] = parentId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(parentId);
    obj[QStringLiteral("status")] = statusToString(status);
    if (!phase.isEmpty()) {
        obj[QStringLiteral("phase")] = phase;
    } else {
        obj.remove(QStringLiteral("phase"));
    }
    obj[QStringLiteral("priority")] = priority;
    if (createdAt.isValid()) {
        obj[QStringLiteral("createdAt")] = isoTimestamp(createdAt);
    }
    if (updatedAt.isValid()) {
        obj[QStringLiteral("updatedAt")] = isoTimestamp(updatedAt);
    }
    return obj;
}

Task Task::fromJson(const QJsonObject &obj)
{
    Task task;
    task.extra = obj;
    task.id = obj.value(QStringLiteral("id")).toString();
    task.title = obj.value(QStringLiteral("title")).toString();
    task.parentId = obj.value(QStringLiteral("parentId")).toString();
    if (!statusFromString(obj.value(QStringLiteral("status")).toString(), &task.status)) {
        task.status = TaskStatus::Pending;
    }
    task.phase = obj.value(QStringLiteral("phase")).toString();
    task.priority = obj.value(QStringLiteral("priority")).toString(QStringLiteral("medium"));
    task.createdAt = parseTimestamp(obj.value(QStringLiteral("createdAt")).toString());
    task.updatedAt = parseTimestamp(obj.value(QStringLiteral("updatedAt")).toString());
    return task;
}

QString Task::statusToString(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Pending:
        return QStringLiteral("pending");
    case TaskStatus::Active:
        return QStringLiteral("active");
    case TaskStatus::Blocked:
        return QStringLiteral("blocked");
    case TaskStatus::Done:
        return QStringLiteral("done");
    }
    return QStringLiteral("pending");
}

bool Task::statusFromString(const QString &value, TaskStatus *status)
{
    if (value == QLatin1String("pending")) {
        *status = TaskStatus::Pending;
    } else if (value == QLatin1String("active")) {
        *status = TaskStatus::Active;
    } else if (value == QLatin1String("blocked")) {
        *status = TaskStatus::Blocked;
    } else if (value == QLatin1String("done")) {
        *status = TaskStatus::Done;
    } else {
        return false;
    }
    return true;
}

int Task::priorityRank(const QString &priority)
{
    if (priority == QLatin1String("critical")) {
        return 4;
    }
    if (priority == QLatin1String("high")) {
        return 3;
    }
    if (priority == QLatin1String("medium")) {
        return 2;
    }
    return 1;
}

bool Task::isKnownPriority(const QString &priority)
{
    return priority == QLatin1String("critical") || priority == QLatin1String("high") || priority == QLatin1String("medium")
        || priority == QLatin1String("low");
}

QString isoTimestamp(const QDateTime &dt)
{
    return dt.toUTC().toString(Qt::ISODate);
}

QDateTime parseTimestamp(const QString &value)
{
    if (value.isEmpty()) {
        return QDateTime();
    }
    return QDateTime::fromString(value, Qt::ISODate);
}

} // namespace Taskscope

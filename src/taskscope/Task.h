/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_TASK_H
#define TASKSCOPE_TASK_H

#include "taskscope_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace Taskscope
{

enum class TaskStatus {
    Pending,
    Active,
    Blocked,
    Done
};

/**
 * One record of the task store.
 *
 * Only the fields the engine reasons about are modelled. Everything else in
 * the record (title, description, labels, notes...) is carried in @c extra
 * and written back untouched, since the task store stays the system of
 * record for descriptive fields.
 */
struct TASKSCOPE_EXPORT Task {
    QString id;
    QString parentId; // empty = top level
    QString title;
    TaskStatus status = TaskStatus::Pending;
    QString phase;
    QString priority = QStringLiteral("medium");
    QDateTime createdAt;
    QDateTime updatedAt;

    QJsonObject extra;

    bool isValid() const
    {
        return !id.isEmpty();
    }

    bool hasParent() const
    {
        return !parentId.isEmpty();
    }

    QJsonObject toJson() const;
    static Task fromJson(const QJsonObject &obj);

    static QString statusToString(TaskStatus status);
    static bool statusFromString(const QString &value, TaskStatus *status);

    /**
     * critical = 4, high = 3, medium = 2, anything else = 1
     */
    static int priorityRank(const QString &priority);
    static bool isKnownPriority(const QString &priority);
};

/**
 * UTC ISO-8601 timestamp with second precision, e.g. 2025-06-01T10:00:00Z
 */
TASKSCOPE_EXPORT QString isoTimestamp(const QDateTime &dt);
TASKSCOPE_EXPORT QDateTime parseTimestamp(const QString &value);

} // namespace Taskscope

#endif // TASKSCOPE_TASK_H

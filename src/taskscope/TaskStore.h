/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_TASKSTORE_H
#define TASKSCOPE_TASKSTORE_H

#include "taskscope_export.h"

#include "Status.h"
#include "Task.h"

#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QStringList>

namespace Taskscope
{

/**
 * In-memory snapshot of the task store document (todo.json).
 *
 * Layout:
 * {
 *   "version": "1.0.0",
 *   "project": "...",
 *   "_meta": { "checksum", "lastModified", "activeSessionCount",
 *              "multiSessionEnabled", "lastIssuedId" },
 *   "tasks": [ {Task}, ... ]
 * }
 *
 * Top-level keys the engine does not know about survive a load/save cycle.
 * A snapshot is built once per operation and never touches the disk; reading
 * and writing goes through DocumentRepository.
 */
class TASKSCOPE_EXPORT TaskStore
{
public:
    TaskStore() = default;

    static TaskStore createEmpty(const QString &projectName);

    /**
     * Parse a loaded document. Returns ParseFailed when the document is not an
     * object or has no "tasks" array.
     */
    static Status fromJson(const QJsonDocument &doc, TaskStore *store);

    /**
     * Serialize, refreshing _meta.checksum from the current task list.
     */
    QJsonDocument toJson() const;

    const QList<Task> &tasks() const
    {
        return m_tasks;
    }

    bool contains(const QString &id) const
    {
        return m_index.contains(id);
    }

    const Task *task(const QString &id) const;

    /**
     * Direct children of @p parentId, in document order.
     */
    QStringList childrenOf(const QString &parentId) const;

    /**
     * parentId -> child ids, built in one pass over the task list.
     */
    QHash<QString, QStringList> childIndex() const;

    /**
     * Returns false when there is no task with that id.
     */
    bool setStatus(const QString &id, TaskStatus status, const QDateTime &now);

    /**
     * Append a task. Returns DuplicateTaskId if the id is already present.
     */
    Status appendTask(const Task &task);

    /**
     * Next free "T###" id. Ids are never reused, so deleted tasks still
     * count through _meta.lastIssuedId.
     */
    QString nextTaskId() const;

    int activeSessionCount() const;
    void setActiveSessionCount(int count);

    bool multiSessionEnabled() const;
    void setMultiSessionEnabled(bool enabled);

    QString storedChecksum() const;
    QString computeChecksum() const;

    QDateTime lastModified() const;
    void touch(const QDateTime &now);

private:
    static int numericId(const QString &id);

    QJsonObject m_root;
    QJsonObject m_meta;
    QList<Task> m_tasks;
    QHash<QString, int> m_index;
};

} // namespace Taskscope

#endif // TASKSCOPE_TASKSTORE_H

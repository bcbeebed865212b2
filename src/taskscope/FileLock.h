/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_FILELOCK_H
#define TASKSCOPE_FILELOCK_H

#include "taskscope_export.h"

#include "Status.h"

#include <QString>

#include <memory>

class QLockFile;

namespace Taskscope
{

/**
 * Exclusive advisory lock on one shared document, held through a sibling
 * "<file>.lock" file.
 *
 * The lock is released by release() or, at the latest, by the destructor,
 * so no lock outlives the scope that took it. Operations that need both
 * documents must construct the session registry lock before the task store
 * lock; destruction then releases them in reverse order.
 */
class TASKSCOPE_EXPORT FileLock
{
public:
    explicit FileLock(const QString &targetPath);
    ~FileLock();

    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;

    /**
     * Block for at most @p timeoutMs. Returns LockTimeout (recoverable) if
     * another holder keeps the lock for longer, WriteFailed if the lock file
     * cannot be created at all.
     */
    Status acquire(int timeoutMs);

    void release();

    bool isLocked() const;

    /**
     * Age after which a lock whose owner is still alive is treated as stale.
     * 0 (the default) never steals a lock from a live owner.
     */
    void setStaleLockTime(int ms);

    QString targetPath() const
    {
        return m_targetPath;
    }

    QString lockPath() const;

    static QString lockPathFor(const QString &targetPath);

private:
    QString m_targetPath;
    std::unique_ptr<QLockFile> m_lock;
    int m_staleLockTimeMs = 0;
};

} // namespace Taskscope

#endif // TASKSCOPE_FILELOCK_H

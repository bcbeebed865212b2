/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_BACKUPMANAGER_H
#define TASKSCOPE_BACKUPMANAGER_H

#include "taskscope_export.h"

#include "Status.h"

#include <QDateTime>
#include <QList>
#include <QString>

namespace Taskscope
{

class AuditLog;

struct TASKSCOPE_EXPORT BackupInfo {
    int number = 0;
    QString path;
    QDateTime modified;
    qint64 size = 0;
};

/**
 * Numbered rollback points for a shared document.
 *
 * Backups of <dir>/todo.json live in <dir>/<backupDirName>/todo.json.<N>,
 * N increasing with every backup. After each new backup the lowest numbers
 * beyond maxBackups are deleted.
 *
 * BackupManager only reads the documents it backs up. Restoring a backup is
 * a regular atomic write of the backup's content, done by the caller under
 * the document's lock.
 */
class TASKSCOPE_EXPORT BackupManager
{
public:
    explicit BackupManager(const QString &backupDirName = QStringLiteral(".backups"), int maxBackups = 10);

    void setAuditLog(AuditLog *log)
    {
        m_auditLog = log;
    }

    int maxBackups() const
    {
        return m_maxBackups;
    }

    void setMaxBackups(int maxBackups);

    QString backupDirFor(const QString &filePath) const;

    /**
     * Copy the current content of @p filePath to a new numbered backup, then
     * rotate. @p backupPath receives the new backup's path.
     */
    Status createBackup(const QString &filePath, QString *backupPath);

    /**
     * Delete the oldest backups of @p filePath beyond maxBackups.
     */
    void rotate(const QString &filePath);

    /**
     * Backups of @p filePath, lowest number first.
     */
    QList<BackupInfo> listBackups(const QString &filePath) const;

    /**
     * Read and sanity-check a backup. @p number <= 0 selects the latest.
     * Empty or unparsable backups are rejected with RestoreFailed.
     */
    Status readBackup(const QString &filePath, int number, QByteArray *content, QString *backupPath = nullptr) const;

private:
    QString m_backupDirName;
    int m_maxBackups;
    AuditLog *m_auditLog = nullptr;
};

} // namespace Taskscope

#endif // TASKSCOPE_BACKUPMANAGER_H

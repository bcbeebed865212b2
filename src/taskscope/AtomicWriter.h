/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_ATOMICWRITER_H
#define TASKSCOPE_ATOMICWRITER_H

#include "taskscope_export.h"

#include "Status.h"

#include <QByteArray>
#include <QString>

class QSaveFile;

namespace Taskscope
{

class BackupManager;
class DocumentValidator;

/**
 * Stage-validate-swap writer for the shared documents.
 *
 * write() either replaces the target completely or leaves it as it was:
 * 1. the content must be a non-empty JSON object accepted by the validator;
 * 2. it is staged in a temporary file next to the target;
 * 3. the current target content becomes a numbered backup (and old backups
 *    are rotated);
 * 4. the staged file is renamed over the target in one step.
 *
 * A failure before step 4 discards the staged file and leaves the target
 * untouched. If the rename itself fails, the backup made in step 3 is copied
 * back before the error is reported.
 *
 * Callers must hold the target's FileLock.
 */
class TASKSCOPE_EXPORT AtomicWriter
{
public:
    explicit AtomicWriter(BackupManager *backups = nullptr);
    virtual ~AtomicWriter();

    Status write(const QString &path, const QByteArray &content, const DocumentValidator &validator);

    /**
     * Backup created by the last successful write(), empty if the target did
     * not exist before.
     */
    QString lastBackupPath() const
    {
        return m_lastBackupPath;
    }

    BackupManager *backupManager() const
    {
        return m_backups;
    }

protected:
    /**
     * Final swap of the staged file over the target.
     */
    virtual bool commitStaged(QSaveFile &staged);

private:
    bool recopyBackup(const QString &backupPath, const QString &path);

    BackupManager *m_backups;
    QString m_lastBackupPath;
};

} // namespace Taskscope

#endif // TASKSCOPE_ATOMICWRITER_H

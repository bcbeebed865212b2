/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AtomicWriter.h"
#include "BackupManager.h"
#include "DocumentValidator.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

namespace Taskscope
{

AtomicWriter::AtomicWriter(BackupManager *backups)
    : m_backups(backups)
{
}

AtomicWriter::~AtomicWriter() = default;

Status AtomicWriter::write(const QString &path, const QByteArray &content, const DocumentValidator &validator)
{
    m_lastBackupPath.clear();

    if (path.isEmpty()) {
        return Status(ErrorCode::InvalidArgument, QStringLiteral("no target path"));
    }

    if (content.trimmed().isEmpty()) {
        return Status(ErrorCode::ValidationFailed, QStringLiteral("refusing to write empty content to %1").arg(path));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(content, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return Status(ErrorCode::ParseFailed, QStringLiteral("content for %1 is not valid JSON: %2").arg(path, parseError.errorString()));
    }

    const ValidationResult validation = validator.validate(doc);
    if (!validation.isValid()) {
        qWarning() << "AtomicWriter: Validation rejected content for" << path << validation.errors;
        return Status(ErrorCode::ValidationFailed, validation.errors.join(QStringLiteral("; ")));
    }

    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return Status(ErrorCode::WriteFailed, QStringLiteral("cannot create directory for %1").arg(path));
    }

    // Stage next to the target so the final rename stays on one filesystem
    QSaveFile staged(path);
    staged.setDirectWriteFallback(false);
    if (!staged.open(QIODevice::WriteOnly)) {
        return Status(ErrorCode::WriteFailed, QStringLiteral("cannot stage %1: %2").arg(path, staged.errorString()));
    }
    if (staged.write(content) != content.size()) {
        const QString reason = staged.errorString();
        staged.cancelWriting();
        return Status(ErrorCode::WriteFailed, QStringLiteral("short write while staging %1: %2").arg(path, reason));
    }

    QString backupPath;
    if (m_backups && QFileInfo::exists(path)) {
        const Status backup = m_backups->createBackup(path, &backupPath);
        if (!backup.isOk()) {
            staged.cancelWriting();
            return Status(ErrorCode::BackupFailed, backup.message());
        }
    }

    if (!commitStaged(staged)) {
        qWarning() << "AtomicWriter: Replace failed for" << path << "-" << staged.errorString();
        QString message = QStringLiteral("failed to replace %1").arg(path);
        if (!backupPath.isEmpty()) {
            if (recopyBackup(backupPath, path)) {
                message += QStringLiteral(" (previous content restored from %1)").arg(backupPath);
            } else {
                message += QStringLiteral(" (restore from %1 also failed)").arg(backupPath);
            }
        }
        return Status(ErrorCode::WriteFailed, message);
    }

    m_lastBackupPath = backupPath;
    return Status::ok();
}

bool AtomicWriter::commitStaged(QSaveFile &staged)
{
    return staged.commit();
}

bool AtomicWriter::recopyBackup(const QString &backupPath, const QString &path)
{
    QFile backup(backupPath);
    if (!backup.open(QIODevice::ReadOnly)) {
        return false;
    }
    const QByteArray data = backup.readAll();
    backup.close();

    QSaveFile target(path);
    if (!target.open(QIODevice::WriteOnly)) {
        return false;
    }
    if (target.write(data) != data.size()) {
        target.cancelWriting();
        return false;
    }
    const bool restored = target.commit();
    if (restored) {
        qDebug() << "AtomicWriter: Restored" << path << "from" << backupPath;
    }
    return restored;
}

} // namespace Taskscope

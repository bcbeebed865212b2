/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "BackupManager.h"
#include "AuditLog.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>

#include <algorithm>

namespace Taskscope
{

BackupManager::BackupManager(const QString &backupDirName, int maxBackups)
    : m_backupDirName(backupDirName)
    , m_maxBackups(qMax(1, maxBackups))
{
}

void BackupManager::setMaxBackups(int maxBackups)
{
    m_maxBackups = qMax(1, maxBackups);
}

QString BackupManager::backupDirFor(const QString &filePath) const
{
    return QFileInfo(filePath).absolutePath() + QLatin1Char('/') + m_backupDirName;
}

Status BackupManager::createBackup(const QString &filePath, QString *backupPath)
{
    if (!QFileInfo::exists(filePath)) {
        return Status(ErrorCode::FileNotFound, QStringLiteral("nothing to back up at %1").arg(filePath));
    }

    const QString dirPath = backupDirFor(filePath);
    if (!QDir().mkpath(dirPath)) {
        return Status(ErrorCode::BackupFailed, QStringLiteral("cannot create backup directory %1").arg(dirPath));
    }

    const QList<BackupInfo> existing = listBackups(filePath);
    const int number = existing.isEmpty() ? 1 : existing.last().number + 1;
    const QString target = dirPath + QLatin1Char('/') + QFileInfo(filePath).fileName() + QLatin1Char('.') + QString::number(number);

    if (!QFile::copy(filePath, target)) {
        qWarning() << "BackupManager: Failed to copy" << filePath << "to" << target;
        return Status(ErrorCode::BackupFailed, QStringLiteral("cannot create backup %1").arg(target));
    }
    if (!QFile::setPermissions(target, QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        qWarning() << "BackupManager: Could not restrict permissions on" << target;
    }

    qDebug() << "BackupManager: Created" << target;

    if (m_auditLog) {
        QJsonObject details;
        details[QStringLiteral("file")] = QFileInfo(filePath).fileName();
        details[QStringLiteral("backup")] = target;
        details[QStringLiteral("number")] = number;
        if (!m_auditLog->append(QStringLiteral("backup_created"), QString(), QString(), details)) {
            qWarning() << "BackupManager: Could not record backup of" << filePath;
        }
    }

    rotate(filePath);

    if (backupPath) {
        *backupPath = target;
    }
    return Status::ok();
}

void BackupManager::rotate(const QString &filePath)
{
    const QList<BackupInfo> backups = listBackups(filePath);
    const int excess = backups.size() - m_maxBackups;
    for (int i = 0; i < excess; ++i) {
        if (QFile::remove(backups.at(i).path)) {
            qDebug() << "BackupManager: Rotated out" << backups.at(i).path;
        } else {
            qWarning() << "BackupManager: Failed to remove old backup" << backups.at(i).path;
        }
    }
}

QList<BackupInfo> BackupManager::listBackups(const QString &filePath) const
{
    QList<BackupInfo> backups;

    QDir dir(backupDirFor(filePath));
    if (!dir.exists()) {
        return backups;
    }

    const QString baseName = QFileInfo(filePath).fileName();
    const QRegularExpression pattern(QStringLiteral("^%1\\.(\\d+)$").arg(QRegularExpression::escape(baseName)));

    const QFileInfoList entries = dir.entryInfoList(QDir::Files);
    for (const QFileInfo &info : entries) {
        const QRegularExpressionMatch match = pattern.match(info.fileName());
        if (!match.hasMatch()) {
            continue;
        }
        BackupInfo backup;
        backup.number = match.captured(1).toInt();
        backup.path = info.absoluteFilePath();
        backup.modified = info.lastModified();
        backup.size = info.size();
        backups.append(backup);
    }

    std::sort(backups.begin(), backups.end(), [](const BackupInfo &a, const BackupInfo &b) {
        return a.number < b.number;
    });
    return backups;
}

Status BackupManager::readBackup(const QString &filePath, int number, QByteArray *content, QString *backupPath) const
{
    const QList<BackupInfo> backups = listBackups(filePath);
    if (backups.isEmpty()) {
        return Status(ErrorCode::FileNotFound, QStringLiteral("no backups found for %1").arg(QFileInfo(filePath).fileName()));
    }

    QString selected;
    if (number <= 0) {
        selected = backups.last().path;
    } else {
        for (const BackupInfo &backup : backups) {
            if (backup.number == number) {
                selected = backup.path;
                break;
            }
        }
        if (selected.isEmpty()) {
            return Status(ErrorCode::FileNotFound, QStringLiteral("backup %1 not found for %2").arg(number).arg(QFileInfo(filePath).fileName()));
        }
    }

    QFile file(selected);
    if (!file.open(QIODevice::ReadOnly)) {
        return Status(ErrorCode::RestoreFailed, QStringLiteral("cannot read backup %1").arg(selected));
    }
    const QByteArray data = file.readAll();
    file.close();

    if (data.trimmed().isEmpty()) {
        return Status(ErrorCode::RestoreFailed, QStringLiteral("backup %1 is empty").arg(selected));
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return Status(ErrorCode::RestoreFailed, QStringLiteral("backup %1 is not valid JSON: %2").arg(selected, error.errorString()));
    }

    *content = data;
    if (backupPath) {
        *backupPath = selected;
    }
    return Status::ok();
}

} // namespace Taskscope

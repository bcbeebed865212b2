/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "FileLock.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QLockFile>

namespace Taskscope
{

FileLock::FileLock(const QString &targetPath)
    : m_targetPath(targetPath)
{
}

FileLock::~FileLock()
{
    release();
}

Status FileLock::acquire(int timeoutMs)
{
    if (isLocked()) {
        return Status::ok();
    }

    const QString path = lockPath();
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return Status(ErrorCode::WriteFailed, QStringLiteral("cannot create directory for %1").arg(path));
    }

    m_lock = std::make_unique<QLockFile>(path);
    m_lock->setStaleLockTime(m_staleLockTimeMs);

    if (m_lock->tryLock(timeoutMs)) {
        qDebug() << "FileLock: Acquired" << path;
        return Status::ok();
    }

    const QLockFile::LockError error = m_lock->error();
    m_lock.reset();

    if (error == QLockFile::LockFailedError) {
        qWarning() << "FileLock: Timed out after" << timeoutMs << "ms waiting for" << path;
        return Status(ErrorCode::LockTimeout, QStringLiteral("timed out after %1 ms waiting for lock on %2").arg(timeoutMs).arg(m_targetPath));
    }

    qWarning() << "FileLock: Cannot create lock file" << path << "error:" << static_cast<int>(error);
    return Status(ErrorCode::WriteFailed, QStringLiteral("cannot create lock file %1").arg(path));
}

void FileLock::release()
{
    if (m_lock) {
        m_lock->unlock();
        m_lock.reset();
        qDebug() << "FileLock: Released" << lockPath();
    }
}

bool FileLock::isLocked() const
{
    return m_lock && m_lock->isLocked();
}

void FileLock::setStaleLockTime(int ms)
{
    m_staleLockTimeMs = ms;
}

QString FileLock::lockPath() const
{
    return lockPathFor(m_targetPath);
}

QString FileLock::lockPathFor(const QString &targetPath)
{
    return targetPath + QStringLiteral(".lock");
}

} // namespace Taskscope

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Status.h"

namespace Taskscope
{

bool Status::isRecoverable() const
{
    switch (m_code) {
    case ErrorCode::LockTimeout:
    case ErrorCode::ChecksumMismatch:
    case ErrorCode::IdCollision:
        return true;
    default:
        return false;
    }
}

QString Status::categoryName() const
{
    return errorCodeName(m_code);
}

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Ok:
        return QStringLiteral("ok");
    case ErrorCode::InvalidArgument:
        return QStringLiteral("invalid-argument");
    case ErrorCode::FileNotFound:
        return QStringLiteral("file-not-found");
    case ErrorCode::WriteFailed:
        return QStringLiteral("write-failed");
    case ErrorCode::BackupFailed:
        return QStringLiteral("backup-failed");
    case ErrorCode::ValidationFailed:
        return QStringLiteral("validation-failed");
    case ErrorCode::RestoreFailed:
        return QStringLiteral("restore-failed");
    case ErrorCode::ParseFailed:
        return QStringLiteral("parse-failed");
    case ErrorCode::LockTimeout:
        return QStringLiteral("lock-timeout");
    case ErrorCode::ChecksumMismatch:
        return QStringLiteral("checksum-mismatch");
    case ErrorCode::IdCollision:
        return QStringLiteral("id-collision");
    case ErrorCode::ParentNotFound:
        return QStringLiteral("parent-not-found");
    case ErrorCode::DepthExceeded:
        return QStringLiteral("depth-exceeded");
    case ErrorCode::SiblingLimit:
        return QStringLiteral("sibling-limit");
    case ErrorCode::TaskNotFound:
        return QStringLiteral("task-not-found");
    case ErrorCode::DuplicateTaskId:
        return QStringLiteral("duplicate-task-id");
    case ErrorCode::SessionExists:
        return QStringLiteral("session-already-exists");
    case ErrorCode::SessionNotFound:
        return QStringLiteral("session-not-found");
    case ErrorCode::ScopeConflict:
        return QStringLiteral("scope-conflict");
    case ErrorCode::ScopeInvalid:
        return QStringLiteral("scope-invalid");
    case ErrorCode::FocusNotInScope:
        return QStringLiteral("focus-not-in-scope");
    case ErrorCode::TaskClaimed:
        return QStringLiteral("task-already-claimed");
    case ErrorCode::SessionWrongState:
        return QStringLiteral("session-wrong-state");
    case ErrorCode::MaxSessions:
        return QStringLiteral("max-sessions-reached");
    case ErrorCode::FocusRequired:
        return QStringLiteral("focus-required");
    }
    return QStringLiteral("unknown");
}

QString documentsWrittenName(DocumentsWritten written)
{
    switch (written) {
    case DocumentsWritten::Neither:
        return QStringLiteral("neither");
    case DocumentsWritten::SessionRegistryOnly:
        return QStringLiteral("session-registry");
    case DocumentsWritten::Both:
        return QStringLiteral("both");
    }
    return QStringLiteral("neither");
}

} // namespace Taskscope

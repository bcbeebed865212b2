/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_STATUS_H
#define TASKSCOPE_STATUS_H

#include "taskscope_export.h"

#include <QString>

namespace Taskscope
{

/**
 * Stable error codes. The numeric values are part of the CLI contract
 * (they are used as process exit codes) and must not be renumbered.
 */
enum class ErrorCode {
    Ok = 0,

    // Structural
    InvalidArgument = 1,
    FileNotFound = 2,
    WriteFailed = 3,
    BackupFailed = 4,
    ValidationFailed = 5,
    RestoreFailed = 6,
    ParseFailed = 7,
    LockTimeout = 8,
    ChecksumMismatch = 9,
    IdCollision = 10,

    // Hierarchy policy
    ParentNotFound = 11,
    DepthExceeded = 12,
    SiblingLimit = 13,
    TaskNotFound = 14,
    DuplicateTaskId = 15,

    // Sessions
    SessionExists = 30,
    SessionNotFound = 31,
    ScopeConflict = 32,
    ScopeInvalid = 33,
    FocusNotInScope = 34,
    TaskClaimed = 35,
    SessionWrongState = 36,
    MaxSessions = 37,
    FocusRequired = 38,
};

/**
 * Which of the two shared documents an operation durably changed.
 * A rejected lifecycle operation always reports Neither.
 */
enum class DocumentsWritten {
    Neither,
    SessionRegistryOnly,
    Both,
};

class TASKSCOPE_EXPORT Status
{
public:
    Status() = default;
    Status(ErrorCode code, const QString &message)
        : m_code(code)
        , m_message(message)
    {
    }

    static Status ok()
    {
        return Status();
    }

    bool isOk() const
    {
        return m_code == ErrorCode::Ok;
    }

    ErrorCode code() const
    {
        return m_code;
    }

    QString message() const
    {
        return m_message;
    }

    DocumentsWritten documentsWritten() const
    {
        return m_written;
    }

    void setDocumentsWritten(DocumentsWritten written)
    {
        m_written = written;
    }

    /**
     * Lock timeouts, checksum mismatches and fresh id collisions are caused
     * by a concurrent invocation and go away when the whole operation is
     * retried. Everything else needs a different request.
     */
    bool isRecoverable() const;

    /**
     * Kebab-case category name, e.g. "scope-conflict".
     */
    QString categoryName() const;

    int exitCode() const
    {
        return static_cast<int>(m_code);
    }

private:
    ErrorCode m_code = ErrorCode::Ok;
    QString m_message;
    DocumentsWritten m_written = DocumentsWritten::Neither;
};

TASKSCOPE_EXPORT QString errorCodeName(ErrorCode code);
TASKSCOPE_EXPORT QString documentsWrittenName(DocumentsWritten written);

} // namespace Taskscope

#endif // TASKSCOPE_STATUS_H

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_SESSIONREGISTRY_H
#define TASKSCOPE_SESSIONREGISTRY_H

#include "taskscope_export.h"

#include "Session.h"
#include "Status.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QList>

namespace Taskscope
{

/**
 * Per-project session policy, stored in the registry's "config" object.
 */
struct TASKSCOPE_EXPORT RegistryConfig {
    int maxConcurrentSessions = 5;
    int maxActiveTasksPerScope = 1;
    QString scopeValidation = QStringLiteral("strict");
    bool allowNestedScopes = true;
    bool allowScopeOverlap = false;

    QJsonObject toJson() const;
    static RegistryConfig fromJson(const QJsonObject &obj);
};

/**
 * In-memory snapshot of the session registry document (sessions.json).
 *
 * Holds the live sessions (active and suspended), the append-only history
 * of ended sessions, the policy config and _meta { checksum, lastModified,
 * totalSessionsCreated }.
 */
class TASKSCOPE_EXPORT SessionRegistry
{
public:
    SessionRegistry() = default;

    static SessionRegistry createEmpty(const QString &projectName, const RegistryConfig &config);

    static Status fromJson(const QJsonDocument &doc, SessionRegistry *registry);
    QJsonDocument toJson() const;

    const RegistryConfig &config() const
    {
        return m_config;
    }

    void setConfig(const RegistryConfig &config)
    {
        m_config = config;
    }

    const QList<Session> &sessions() const
    {
        return m_sessions;
    }

    QList<Session> activeSessions() const;
    QList<Session> suspendedSessions() const;

    const QList<SessionHistoryEntry> &history() const
    {
        return m_history;
    }

    /**
     * Live sessions, active and suspended.
     */
    int liveCount() const
    {
        return m_sessions.size();
    }

    bool contains(const QString &sessionId) const;
    bool historyContains(const QString &sessionId) const;

    const Session *session(const QString &sessionId) const;
    Session *session(const QString &sessionId);

    /**
     * Live session (other than @p exceptSessionId) whose current focus is
     * @p taskId, or nullptr. @p activeOnly skips suspended sessions.
     */
    const Session *focusOwner(const QString &taskId, bool activeOnly, const QString &exceptSessionId = QString()) const;

    /**
     * Appends a new live session and bumps totalSessionsCreated.
     */
    void addSession(const Session &session);

    /**
     * Removes the live session and appends its history entry.
     * Returns false if no such live session exists.
     */
    bool endSession(const QString &sessionId, const SessionHistoryEntry &entry);

    int totalSessionsCreated() const;
    QString storedChecksum() const;
    void touch(const QDateTime &now);

private:
    QJsonObject m_root;
    QJsonObject m_meta;
    RegistryConfig m_config;
    QList<Session> m_sessions;
    QList<SessionHistoryEntry> m_history;
};

} // namespace Taskscope

#endif // TASKSCOPE_SESSIONREGISTRY_H

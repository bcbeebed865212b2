/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRegistry.h"
#include "Checksum.h"
#include "Task.h"

#include <QJsonArray>

namespace Taskscope
{

QJsonObject RegistryConfig::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("maxConcurrentSessions")] = maxConcurrentSessions;
    obj[QStringLiteral("maxActiveTasksPerScope")] = maxActiveTasksPerScope;
    obj[QStringLiteral("scopeValidation")] = scopeValidation;
    obj[QStringLiteral("allowNestedScopes")] = allowNestedScopes;
    obj[QStringLiteral("allowScopeOverlap")] = allowScopeOverlap;
    return obj;
}

RegistryConfig RegistryConfig::fromJson(const QJsonObject &obj)
{
    RegistryConfig config;
    config.maxConcurrentSessions = obj.value(QStringLiteral("maxConcurrentSessions")).toInt(5);
    config.maxActiveTasksPerScope = obj.value(QStringLiteral("maxActiveTasksPerScope")).toInt(1);
    config.scopeValidation = obj.value(QStringLiteral("scopeValidation")).toString(QStringLiteral("strict"));
    config.allowNestedScopes = obj.value(QStringLiteral("allowNestedScopes")).toBool(true);
    config.allowScopeOverlap = obj.value(QStringLiteral("allowScopeOverlap")).toBool(false);
    return config;
}

SessionRegistry SessionRegistry::createEmpty(const QString &projectName, const RegistryConfig &config)
{
    SessionRegistry registry;
    registry.m_root[QStringLiteral("version")] = QStringLiteral("1.0.0");
    registry.m_root[QStringLiteral("project")] = projectName;
    registry.m_meta[QStringLiteral("totalSessionsCreated")] = 0;
    registry.m_config = config;
    registry.touch(QDateTime::currentDateTimeUtc());
    return registry;
}

Status SessionRegistry::fromJson(const QJsonDocument &doc, SessionRegistry *registry)
{
    if (!doc.isObject()) {
        return Status(ErrorCode::ParseFailed, QStringLiteral("session registry is not a JSON object"));
    }

    const QJsonObject root = doc.object();
    if (!root.value(QStringLiteral("sessions")).isArray()) {
        return Status(ErrorCode::ParseFailed, QStringLiteral("session registry has no \"sessions\" array"));
    }

    SessionRegistry result;
    result.m_root = root;
    for (const QString &key : {QStringLiteral("_meta"), QStringLiteral("config"), QStringLiteral("sessions"), QStringLiteral("sessionHistory")}) {
        result.m_root.remove(key);
    }
    result.m_meta = root.value(QStringLiteral("_meta")).toObject();
    result.m_config = RegistryConfig::fromJson(root.value(QStringLiteral("config")).toObject());

    const QJsonArray sessions = root.value(QStringLiteral("sessions")).toArray();
    for (const QJsonValue &value : sessions) {
        result.m_sessions.append(Session::fromJson(value.toObject()));
    }

    const QJsonArray history = root.value(QStringLiteral("sessionHistory")).toArray();
    for (const QJsonValue &value : history) {
        result.m_history.append(SessionHistoryEntry::fromJson(value.toObject()));
    }

    *registry = result;
    return Status::ok();
}

QJsonDocument SessionRegistry::toJson() const
{
    QJsonArray sessions;
    for (const Session &session : m_sessions) {
        sessions.append(session.toJson());
    }

    QJsonArray history;
    for (const SessionHistoryEntry &entry : m_history) {
        history.append(entry.toJson());
    }

    QJsonObject meta = m_meta;
    meta[QStringLiteral("checksum")] = Checksum::ofCollection(sessions);

    QJsonObject root = m_root;
    root[QStringLiteral("_meta")] = meta;
    root[QStringLiteral("config")] = m_config.toJson();
    root[QStringLiteral("sessions")] = sessions;
    root[QStringLiteral("sessionHistory")] = history;
    return QJsonDocument(root);
}

QList<Session> SessionRegistry::activeSessions() const
{
    QList<Session> result;
    for (const Session &session : m_sessions) {
        if (session.status == Session::Active) {
            result.append(session);
        }
    }
    return result;
}

QList<Session> SessionRegistry::suspendedSessions() const
{
    QList<Session> result;
    for (const Session &session : m_sessions) {
        if (session.status == Session::Suspended) {
            result.append(session);
        }
    }
    return result;
}

bool SessionRegistry::contains(const QString &sessionId) const
{
    return session(sessionId) != nullptr;
}

bool SessionRegistry::historyContains(const QString &sessionId) const
{
    for (const SessionHistoryEntry &entry : m_history) {
        if (entry.id == sessionId) {
            return true;
        }
    }
    return false;
}

const Session *SessionRegistry::session(const QString &sessionId) const
{
    for (const Session &session : m_sessions) {
        if (session.id == sessionId) {
            return &session;
        }
    }
    return nullptr;
}

Session *SessionRegistry::session(const QString &sessionId)
{
    for (Session &session : m_sessions) {
        if (session.id == sessionId) {
            return &session;
        }
    }
    return nullptr;
}

const Session *SessionRegistry::focusOwner(const QString &taskId, bool activeOnly, const QString &exceptSessionId) const
{
    if (taskId.isEmpty()) {
        return nullptr;
    }
    for (const Session &session : m_sessions) {
        if (session.id == exceptSessionId) {
            continue;
        }
        if (activeOnly && session.status != Session::Active) {
            continue;
        }
        if (session.focus.currentTask == taskId) {
            return &session;
        }
    }
    return nullptr;
}

void SessionRegistry::addSession(const Session &session)
{
    m_sessions.append(session);
    m_meta[QStringLiteral("totalSessionsCreated")] = totalSessionsCreated() + 1;
}

bool SessionRegistry::endSession(const QString &sessionId, const SessionHistoryEntry &entry)
{
    for (int i = 0; i < m_sessions.size(); ++i) {
        if (m_sessions.at(i).id == sessionId) {
            m_sessions.removeAt(i);
            m_history.append(entry);
            return true;
        }
    }
    return false;
}

int SessionRegistry::totalSessionsCreated() const
{
    return m_meta.value(QStringLiteral("totalSessionsCreated")).toInt(0);
}

QString SessionRegistry::storedChecksum() const
{
    return m_meta.value(QStringLiteral("checksum")).toString();
}

void SessionRegistry::touch(const QDateTime &now)
{
    m_meta[QStringLiteral("lastModified")] = isoTimestamp(now);
}

} // namespace Taskscope

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_SESSION_H
#define TASKSCOPE_SESSION_H

#include "taskscope_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

namespace Taskscope
{

enum class ScopeType {
    Task,
    TaskGroup,
    Subtree,
    EpicPhase,
    Epic,
    Custom
};

/**
 * Declarative description of which tasks a session may claim.
 *
 * computedTaskIds is filled in exactly once, when the session is started,
 * and is never recomputed afterwards. Re-resolving against a later snapshot
 * would silently change what the session has claimed.
 */
struct TASKSCOPE_EXPORT ScopeDeclaration {
    static constexpr int DefaultMaxDepth = 10;

    ScopeType type = ScopeType::Task;
    QString rootTaskId;
    QString phaseFilter;
    int maxDepth = DefaultMaxDepth;
    QStringList excludeTaskIds;
    QStringList taskIds; // custom scopes only
    QStringList computedTaskIds;

    QJsonObject toJson() const;
    static ScopeDeclaration fromJson(const QJsonObject &obj);

    static QString typeToString(ScopeType type);
    static bool typeFromString(const QString &value, ScopeType *type);
};

struct TASKSCOPE_EXPORT FocusEvent {
    QString taskId;
    QDateTime timestamp;
    QString action; // "focused", "completed", "released"

    QJsonObject toJson() const;
    static FocusEvent fromJson(const QJsonObject &obj);
};

struct TASKSCOPE_EXPORT FocusState {
    QString currentTask; // empty = no focus
    QString previousTask;
    QString sessionNote;
    QList<FocusEvent> focusHistory; // append-only

    QJsonObject toJson() const;
    static FocusState fromJson(const QJsonObject &obj);
};

struct TASKSCOPE_EXPORT SessionStats {
    int tasksCompleted = 0;
    int focusChanges = 0;
    int suspendCount = 0;
    int resumeCount = 0;

    QJsonObject toJson() const;
    static SessionStats fromJson(const QJsonObject &obj);
};

/**
 * A live session record in the session registry.
 */
class TASKSCOPE_EXPORT Session
{
public:
    enum Status {
        Active,
        Suspended
    };

    QString id;
    Status status = Active;
    QString name;
    QString agentId;

    ScopeDeclaration scope;
    FocusState focus;
    SessionStats stats;

    QDateTime startedAt;
    QDateTime lastActivity;
    QDateTime suspendedAt; // invalid unless suspended

    bool isValid() const
    {
        return !id.isEmpty();
    }

    bool isActive() const
    {
        return status == Active;
    }

    bool inScope(const QString &taskId) const
    {
        return scope.computedTaskIds.contains(taskId);
    }

    QJsonObject toJson() const;
    static Session fromJson(const QJsonObject &obj);

    static QString statusToString(Status status);
    static bool statusFromString(const QString &value, Status *status);

    /**
     * session_YYYYMMDD_HHMMSS_<6 hex chars>
     */
    static QString generateId(const QDateTime &now);

    bool operator==(const Session &other) const
    {
        return id == other.id;
    }
};

/**
 * Immutable record appended to sessionHistory when a session ends.
 */
struct TASKSCOPE_EXPORT SessionHistoryEntry {
    QString id;
    QString name;
    QString agentId;
    ScopeType scopeType = ScopeType::Task;
    QString rootTaskId;
    QStringList computedTaskIds;
    QString lastFocus;
    QDateTime startedAt;
    QDateTime endedAt;
    SessionStats stats;
    QString endNote;

    static SessionHistoryEntry fromSession(const Session &session, const QDateTime &endedAt, const QString &note);

    QJsonObject toJson() const;
    static SessionHistoryEntry fromJson(const QJsonObject &obj);
};

} // namespace Taskscope

#endif // TASKSCOPE_SESSION_H

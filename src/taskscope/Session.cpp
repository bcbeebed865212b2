/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Session.h"
#include "Task.h"

#include <QJsonArray>
#include <QRandomGenerator>

namespace Taskscope
{

namespace
{

QJsonValue nullable(const QString &value)
{
    return value.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(value);
}

QJsonValue nullable(const QDateTime &value)
{
    return value.isValid() ? QJsonValue(isoTimestamp(value)) : QJsonValue(QJsonValue::Null);
}

QJsonArray toArray(const QStringList &list)
{
    QJsonArray array;
    for (const QString &item : list) {
        array.append(item);
    }
    return array;
}

QStringList toStringList(const QJsonValue &value)
{
    QStringList list;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &item : array) {
        list.append(item.toString());
    }
    return list;
}

} // namespace

// ScopeDeclaration

QJsonObject ScopeDeclaration::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("type")] = typeToString(type);
    if (type != ScopeType::Custom) {
        obj[QStringLiteral("rootTaskId")] = rootTaskId;
    }
    if (type == ScopeType::EpicPhase) {
        obj[QStringLiteral("phaseFilter")] = phaseFilter;
    }
    obj[QStringLiteral("maxDepth")] = maxDepth;
    obj[QStringLiteral("excludeTaskIds")] = toArray(excludeTaskIds);
    if (type == ScopeType::Custom) {
        obj[QStringLiteral("taskIds")] = toArray(taskIds);
    }
    obj[QStringLiteral("computedTaskIds")] = toArray(computedTaskIds);
    return obj;
}

ScopeDeclaration ScopeDeclaration::fromJson(const QJsonObject &obj)
{
    ScopeDeclaration scope;
    if (!typeFromString(obj.value(QStringLiteral("type")).toString(), &scope.type)) {
        scope.type = ScopeType::Task;
    }
    scope.rootTaskId = obj.value(QStringLiteral("rootTaskId")).toString();
    scope.phaseFilter = obj.value(QStringLiteral("phaseFilter")).toString();
    scope.maxDepth = obj.value(QStringLiteral("maxDepth")).toInt(DefaultMaxDepth);
    scope.excludeTaskIds = toStringList(obj.value(QStringLiteral("excludeTaskIds")));
    scope.taskIds = toStringList(obj.value(QStringLiteral("taskIds")));
    scope.computedTaskIds = toStringList(obj.value(QStringLiteral("computedTaskIds")));
    return scope;
}

QString ScopeDeclaration::typeToString(ScopeType type)
{
    switch (type) {
    case ScopeType::Task:
        return QStringLiteral("task");
    case ScopeType::TaskGroup:
        return QStringLiteral("taskGroup");
    case ScopeType::Subtree:
        return QStringLiteral("subtree");
    case ScopeType::EpicPhase:
        return QStringLiteral("epicPhase");
    case ScopeType::Epic:
        return QStringLiteral("epic");
    case ScopeType::Custom:
        return QStringLiteral("custom");
    }
    return QStringLiteral("task");
}

bool ScopeDeclaration::typeFromString(const QString &value, ScopeType *type)
{
    static const QList<ScopeType> all = {ScopeType::Task,
                                         ScopeType::TaskGroup,
                                         ScopeType::Subtree,
                                         ScopeType::EpicPhase,
                                         ScopeType::Epic,
                                         ScopeType::Custom};
    for (ScopeType candidate : all) {
        if (typeToString(candidate) == value) {
            *type = candidate;
            return true;
        }
    }
    return false;
}

// Focus

QJsonObject FocusEvent::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("taskId")] = taskId;
    obj[QStringLiteral("timestamp")] = isoTimestamp(timestamp);
    obj[QStringLiteral("action")] = action;
    return obj;
}

FocusEvent FocusEvent::fromJson(const QJsonObject &obj)
{
    FocusEvent event;
    event.taskId = obj.value(QStringLiteral("taskId")).toString();
    event.timestamp = parseTimestamp(obj.value(QStringLiteral("timestamp")).toString());
    event.action = obj.value(QStringLiteral("action")).toString();
    return event;
}

QJsonObject FocusState::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("currentTask")] = nullable(currentTask);
    obj[QStringLiteral("previousTask")] = nullable(previousTask);
    obj[QStringLiteral("sessionNote")] = nullable(sessionNote);

    QJsonArray history;
    for (const FocusEvent &event : focusHistory) {
        history.append(event.toJson());
    }
    obj[QStringLiteral("focusHistory")] = history;
    return obj;
}

FocusState FocusState::fromJson(const QJsonObject &obj)
{
    FocusState focus;
    focus.currentTask = obj.value(QStringLiteral("currentTask")).toString();
    focus.previousTask = obj.value(QStringLiteral("previousTask")).toString();
    focus.sessionNote = obj.value(QStringLiteral("sessionNote")).toString();
    const QJsonArray history = obj.value(QStringLiteral("focusHistory")).toArray();
    for (const QJsonValue &value : history) {
        focus.focusHistory.append(FocusEvent::fromJson(value.toObject()));
    }
    return focus;
}

QJsonObject SessionStats::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("tasksCompleted")] = tasksCompleted;
    obj[QStringLiteral("focusChanges")] = focusChanges;
    obj[QStringLiteral("suspendCount")] = suspendCount;
    obj[QStringLiteral("resumeCount")] = resumeCount;
    return obj;
}

SessionStats SessionStats::fromJson(const QJsonObject &obj)
{
    SessionStats stats;
    stats.tasksCompleted = obj.value(QStringLiteral("tasksCompleted")).toInt();
    stats.focusChanges = obj.value(QStringLiteral("focusChanges")).toInt();
    stats.suspendCount = obj.value(QStringLiteral("suspendCount")).toInt();
    stats.resumeCount = obj.value(QStringLiteral("resumeCount")).toInt();
    return stats;
}

// Session

QJsonObject Session::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("status")] = statusToString(status);
    obj[QStringLiteral("name")] = nullable(name);
    obj[QStringLiteral("agentId")] = nullable(agentId);
    obj[QStringLiteral("scope")] = scope.toJson();
    obj[QStringLiteral("focus")] = focus.toJson();
    obj[QStringLiteral("stats")] = stats.toJson();
    obj[QStringLiteral("startedAt")] = nullable(startedAt);
    obj[QStringLiteral("lastActivity")] = nullable(lastActivity);
    obj[QStringLiteral("suspendedAt")] = nullable(suspendedAt);
    return obj;
}

Session Session::fromJson(const QJsonObject &obj)
{
    Session session;
    session.id = obj.value(QStringLiteral("id")).toString();
    if (!statusFromString(obj.value(QStringLiteral("status")).toString(), &session.status)) {
        session.status = Active;
    }
    session.name = obj.value(QStringLiteral("name")).toString();
    session.agentId = obj.value(QStringLiteral("agentId")).toString();
    session.scope = ScopeDeclaration::fromJson(obj.value(QStringLiteral("scope")).toObject());
    session.focus = FocusState::fromJson(obj.value(QStringLiteral("focus")).toObject());
    session.stats = SessionStats::fromJson(obj.value(QStringLiteral("stats")).toObject());
    session.startedAt = parseTimestamp(obj.value(QStringLiteral("startedAt")).toString());
    session.lastActivity = parseTimestamp(obj.value(QStringLiteral("lastActivity")).toString());
    session.suspendedAt = parseTimestamp(obj.value(QStringLiteral("suspendedAt")).toString());
    return session;
}

QString Session::statusToString(Status status)
{
    return status == Suspended ? QStringLiteral("suspended") : QStringLiteral("active");
}

bool Session::statusFromString(const QString &value, Status *status)
{
    if (value == QLatin1String("active")) {
        *status = Active;
        return true;
    }
    if (value == QLatin1String("suspended")) {
        *status = Suspended;
        return true;
    }
    return false;
}

QString Session::generateId(const QDateTime &now)
{
    QString suffix;
    suffix.reserve(6);
    for (int i = 0; i < 6; ++i) {
        int r = QRandomGenerator::global()->bounded(16);
        suffix.append(QLatin1Char("0123456789abcdef"[r]));
    }
    return QStringLiteral("session_%1_%2").arg(now.toUTC().toString(QStringLiteral("yyyyMMdd_HHmmss")), suffix);
}

// History

SessionHistoryEntry SessionHistoryEntry::fromSession(const Session &session, const QDateTime &endedAt, const QString &note)
{
    SessionHistoryEntry entry;
    entry.id = session.id;
    entry.name = session.name;
    entry.agentId = session.agentId;
    entry.scopeType = session.scope.type;
    entry.rootTaskId = session.scope.rootTaskId;
    entry.computedTaskIds = session.scope.computedTaskIds;
    entry.lastFocus = session.focus.currentTask;
    entry.startedAt = session.startedAt;
    entry.endedAt = endedAt;
    entry.stats = session.stats;
    entry.endNote = note;
    return entry;
}

QJsonObject SessionHistoryEntry::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("name")] = nullable(name);
    obj[QStringLiteral("agentId")] = nullable(agentId);
    obj[QStringLiteral("scopeType")] = ScopeDeclaration::typeToString(scopeType);
    obj[QStringLiteral("rootTaskId")] = nullable(rootTaskId);
    obj[QStringLiteral("computedTaskIds")] = toArray(computedTaskIds);
    obj[QStringLiteral("lastFocus")] = nullable(lastFocus);
    obj[QStringLiteral("startedAt")] = nullable(startedAt);
    obj[QStringLiteral("endedAt")] = nullable(endedAt);
    obj[QStringLiteral("stats")] = stats.toJson();
    obj[QStringLiteral("endNote")] = nullable(endNote);
    return obj;
}

SessionHistoryEntry SessionHistoryEntry::fromJson(const QJsonObject &obj)
{
    SessionHistoryEntry entry;
    entry.id = obj.value(QStringLiteral("id")).toString();
    entry.name = obj.value(QStringLiteral("name")).toString();
    entry.agentId = obj.value(QStringLiteral("agentId")).toString();
    if (!ScopeDeclaration::typeFromString(obj.value(QStringLiteral("scopeType")).toString(), &entry.scopeType)) {
        entry.scopeType = ScopeType::Task;
    }
    entry.rootTaskId = obj.value(QStringLiteral("rootTaskId")).toString();
    entry.computedTaskIds = toStringList(obj.value(QStringLiteral("computedTaskIds")));
    entry.lastFocus = obj.value(QStringLiteral("lastFocus")).toString();
    entry.startedAt = parseTimestamp(obj.value(QStringLiteral("startedAt")).toString());
    entry.endedAt = parseTimestamp(obj.value(QStringLiteral("endedAt")).toString());
    entry.stats = SessionStats::fromJson(obj.value(QStringLiteral("stats")).toObject());
    entry.endNote = obj.value(QStringLiteral("endNote")).toString();
    return entry;
}

} // namespace Taskscope

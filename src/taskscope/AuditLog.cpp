/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AuditLog.h"
#include "Task.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QRandomGenerator>
#include <QStringList>

namespace Taskscope
{

QJsonObject AuditEvent::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("timestamp")] = isoTimestamp(timestamp);
    obj[QStringLiteral("sessionId")] = sessionId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(sessionId);
    obj[QStringLiteral("action")] = action;
    obj[QStringLiteral("actor")] = actor;
    obj[QStringLiteral("taskId")] = taskId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(taskId);
    obj[QStringLiteral("details")] = details;
    return obj;
}

AuditEvent AuditEvent::fromJson(const QJsonObject &obj)
{
    AuditEvent event;
    event.id = obj.value(QStringLiteral("id")).toString();
    event.timestamp = parseTimestamp(obj.value(QStringLiteral("timestamp")).toString());
    event.sessionId = obj.value(QStringLiteral("sessionId")).toString();
    event.action = obj.value(QStringLiteral("action")).toString();
    event.actor = obj.value(QStringLiteral("actor")).toString();
    event.taskId = obj.value(QStringLiteral("taskId")).toString();
    event.details = obj.value(QStringLiteral("details")).toObject();
    return event;
}

AuditLog::AuditLog(const QString &path)
    : m_path(path)
{
}

bool AuditLog::append(AuditEvent event)
{
    if (!isKnownAction(event.action)) {
        qWarning() << "AuditLog: Refusing unknown action" << event.action;
        return false;
    }
    if (!isKnownActor(event.actor)) {
        qWarning() << "AuditLog: Refusing unknown actor" << event.actor;
        return false;
    }

    if (event.id.isEmpty()) {
        event.id = generateId();
    }
    if (!event.timestamp.isValid()) {
        event.timestamp = QDateTime::currentDateTimeUtc();
    }

    if (!QDir().mkpath(QFileInfo(m_path).absolutePath())) {
        qWarning() << "AuditLog: Cannot create directory for" << m_path;
        return false;
    }

    QFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        qWarning() << "AuditLog: Cannot open" << m_path << "-" << file.errorString();
        return false;
    }

    const QByteArray line = QJsonDocument(event.toJson()).toJson(QJsonDocument::Compact) + '\n';
    if (file.write(line) != line.size()) {
        qWarning() << "AuditLog: Short write to" << m_path;
        return false;
    }
    return true;
}

bool AuditLog::append(const QString &action, const QString &sessionId, const QString &taskId, const QJsonObject &details, const QString &actor)
{
    AuditEvent event;
    event.action = action;
    event.sessionId = sessionId;
    event.taskId = taskId;
    event.details = details;
    event.actor = actor;
    return append(event);
}

QList<AuditEvent> AuditLog::entries() const
{
    QList<AuditEvent> events;

    QFile file(m_path);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return events;
    }

    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &error);
        if (error.error != QJsonParseError::NoError || !doc.isObject()) {
            continue;
        }
        events.append(AuditEvent::fromJson(doc.object()));
    }

    return events;
}

bool AuditLog::isKnownAction(const QString &action)
{
    static const QStringList actions = {
        QStringLiteral("session_start"),
        QStringLiteral("session_suspend"),
        QStringLiteral("session_resume"),
        QStringLiteral("session_end"),
        QStringLiteral("focus_changed"),
        QStringLiteral("status_changed"),
        QStringLiteral("task_created"),
        QStringLiteral("backup_created"),
        QStringLiteral("backup_restored"),
        QStringLiteral("error_occurred"),
    };
    return actions.contains(action);
}

bool AuditLog::isKnownActor(const QString &actor)
{
    return actor == QLatin1String("human") || actor == QLatin1String("agent") || actor == QLatin1String("system");
}

QString AuditLog::generateId()
{
    QString id = QStringLiteral("log_");
    for (int i = 0; i < 12; ++i) {
        int r = QRandomGenerator::global()->bounded(16);
        id.append(QLatin1Char("0123456789abcdef"[r]));
    }
    return id;
}

} // namespace Taskscope

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_AUDITLOG_H
#define TASKSCOPE_AUDITLOG_H

#include "taskscope_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>

namespace Taskscope
{

/**
 * One structured audit event.
 */
struct TASKSCOPE_EXPORT AuditEvent {
    QString id; // log_<12 hex>
    QDateTime timestamp;
    QString sessionId;
    QString action;
    QString actor = QStringLiteral("system"); // human, agent, system
    QString taskId;
    QJsonObject details;

    QJsonObject toJson() const;
    static AuditEvent fromJson(const QJsonObject &obj);
};

/**
 * Append-only audit trail, one JSON object per line.
 *
 * The log is write-only from the engine's point of view: a failed append is
 * reported through qWarning() and the return value, but never fails the
 * operation that produced the event.
 */
class TASKSCOPE_EXPORT AuditLog
{
public:
    explicit AuditLog(const QString &path);

    QString path() const
    {
        return m_path;
    }

    /**
     * Stamps id and timestamp when missing, then appends.
     */
    bool append(AuditEvent event);

    bool append(const QString &action,
                const QString &sessionId = QString(),
                const QString &taskId = QString(),
                const QJsonObject &details = QJsonObject(),
                const QString &actor = QStringLiteral("system"));

    /**
     * All entries, oldest first. Malformed lines are skipped.
     */
    QList<AuditEvent> entries() const;

    static bool isKnownAction(const QString &action);
    static bool isKnownActor(const QString &actor);
    static QString generateId();

private:
    QString m_path;
};

} // namespace Taskscope

#endif // TASKSCOPE_AUDITLOG_H

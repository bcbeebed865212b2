/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ConflictDetector.h"
#include "SessionRegistry.h"

#include <QSet>

#include <utility>

namespace Taskscope
{

QString ConflictReport::typeToString(Type type)
{
    switch (type) {
    case None:
        return QStringLiteral("none");
    case Partial:
        return QStringLiteral("partial");
    case Nested:
        return QStringLiteral("nested");
    case Identical:
        return QStringLiteral("identical");
    case Hard:
        return QStringLiteral("hard");
    }
    return QString();
}

ConflictReport ConflictDetector::detect(const QList<Session> &activeSessions, const QStringList &candidateIds, const QString &candidateFocusId)
{
    const QList<ConflictReport> reports = detectAll(activeSessions, candidateIds, candidateFocusId);
    if (reports.isEmpty()) {
        return ConflictReport();
    }
    return reports.first();
}

QList<ConflictReport> ConflictDetector::detectAll(const QList<Session> &activeSessions, const QStringList &candidateIds, const QString &candidateFocusId)
{
    QList<ConflictReport> reports;

    if (!candidateFocusId.isEmpty()) {
        for (const Session &other : activeSessions) {
            if (!other.isActive() || other.focus.currentTask != candidateFocusId) {
                continue;
            }
            ConflictReport report;
            report.type = ConflictReport::Hard;
            report.sessionId = other.id;
            report.overlap = QStringList{candidateFocusId};
            report.message = QStringLiteral("task %1 is already the focus of session %2").arg(candidateFocusId, other.id);
            reports.append(report);
        }
    }

    for (const Session &other : activeSessions) {
        if (!other.isActive()) {
            continue;
        }
        bool alreadyHard = false;
        for (const ConflictReport &hard : std::as_const(reports)) {
            if (hard.sessionId == other.id) {
                alreadyHard = true;
                break;
            }
        }
        if (alreadyHard) {
            continue;
        }

        const ConflictReport report = classify(other, candidateIds);
        if (report.isConflict()) {
            reports.append(report);
        }
    }

    return reports;
}

ConflictReport ConflictDetector::classify(const Session &other, const QStringList &candidateIds)
{
    ConflictReport report;

    const QSet<QString> candidate(candidateIds.cbegin(), candidateIds.cend());
    const QStringList &otherIds = other.scope.computedTaskIds;
    const QSet<QString> existing(otherIds.cbegin(), otherIds.cend());

    // Keep the candidate's order so messages are stable
    for (const QString &id : candidateIds) {
        if (existing.contains(id) && !report.overlap.contains(id)) {
            report.overlap.append(id);
        }
    }

    if (report.overlap.isEmpty()) {
        return report;
    }

    report.sessionId = other.id;
    const int overlapSize = report.overlap.size();

    if (overlapSize == candidate.size() && overlapSize == existing.size()) {
        report.type = ConflictReport::Identical;
        report.message = QStringLiteral("scope is identical to session %1").arg(other.id);
    } else if (overlapSize == candidate.size() || overlapSize == existing.size()) {
        report.type = ConflictReport::Nested;
        report.message = QStringLiteral("scope is nested with session %1 (%2 shared task(s))").arg(other.id).arg(overlapSize);
    } else {
        report.type = ConflictReport::Partial;
        report.message = QStringLiteral("scope partially overlaps session %1 on %2").arg(other.id, report.overlap.join(QStringLiteral(", ")));
    }

    return report;
}

ConflictDecision ConflictDetector::evaluate(const ConflictReport &report, const RegistryConfig &config)
{
    ConflictDecision decision;

    switch (report.type) {
    case ConflictReport::None:
        break;
    case ConflictReport::Hard:
        decision.allowed = false;
        decision.status = Status(ErrorCode::TaskClaimed, report.message);
        break;
    case ConflictReport::Identical:
        decision.allowed = false;
        decision.status = Status(ErrorCode::ScopeConflict, report.message);
        break;
    case ConflictReport::Nested:
        if (config.allowNestedScopes) {
            decision.warning = report.message;
        } else {
            decision.allowed = false;
            decision.status = Status(ErrorCode::ScopeConflict, report.message);
        }
        break;
    case ConflictReport::Partial:
        if (config.allowScopeOverlap) {
            decision.warning = report.message;
        } else {
            decision.allowed = false;
            decision.status = Status(ErrorCode::ScopeConflict, report.message);
        }
        break;
    }

    return decision;
}

} // namespace Taskscope

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_CONFLICTDETECTOR_H
#define TASKSCOPE_CONFLICTDETECTOR_H

#include "taskscope_export.h"

#include "Session.h"
#include "Status.h"

#include <QList>
#include <QStringList>

namespace Taskscope
{

struct RegistryConfig;

/**
 * Outcome of comparing a candidate claim with one other active session.
 */
struct TASKSCOPE_EXPORT ConflictReport {
    enum Type {
        None,
        Partial, // some overlap, neither set contains the other
        Nested, // one set contains the other
        Identical, // same set
        Hard // candidate focus is the other session's current focus
    };
    Type type = None;

    QString sessionId; // the other session, empty for None
    QStringList overlap;
    QString message;

    bool isConflict() const
    {
        return type != None;
    }

    static QString typeToString(Type type);
};

/**
 * Result of applying the registry's conflict policy to a report.
 */
struct TASKSCOPE_EXPORT ConflictDecision {
    bool allowed = true;
    Status status; // set when !allowed
    QString warning; // set for permitted nested overlaps
};

/**
 * Classifies overlaps between a candidate scope and the active sessions.
 *
 * Pure: nothing here reads or writes documents.
 */
class TASKSCOPE_EXPORT ConflictDetector
{
public:
    /**
     * First conflicting session wins. The hard (same focus) check runs over
     * every active session before any set comparison, so a focus clash is
     * never reported as a mere overlap.
     */
    static ConflictReport detect(const QList<Session> &activeSessions, const QStringList &candidateIds, const QString &candidateFocusId);

    /**
     * One report per conflicting session, hard conflicts first.
     */
    static QList<ConflictReport> detectAll(const QList<Session> &activeSessions, const QStringList &candidateIds, const QString &candidateFocusId);

    /**
     * Set comparison against a single session, ignoring focus.
     */
    static ConflictReport classify(const Session &other, const QStringList &candidateIds);

    static ConflictDecision evaluate(const ConflictReport &report, const RegistryConfig &config);

private:
    ConflictDetector() = default;
};

} // namespace Taskscope

#endif // TASKSCOPE_CONFLICTDETECTOR_H

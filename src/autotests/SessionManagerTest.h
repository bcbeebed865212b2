/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONMANAGERTEST_H
#define SESSIONMANAGERTEST_H

#include <QObject>

namespace Taskscope
{

class SessionManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // End-to-end
    void testStartAutoSelectsFocus();
    void testSecondClaimOnSameTaskIsHardConflict();
    void testNestedScopeIsPermitted();
    void testPartialOverlapIsRejected();
    void testLeafSubtreeAndMissingRoot();
    void testSuspendThenEnd();

    // Lifecycle
    void testSuspendResumeCycle();
    void testResumeActiveSessionFails();
    void testSuspendSuspendedSessionFails();
    void testResumeBlockedByNewClaim();
    void testFocusRequired();
    void testFocusNotInScope();
    void testExplicitFocusClaimedElsewhere();
    void testComputedScopeIsFrozen();
    void testMaxSessions();
    void testStaleActiveTasksDemoted();
    void testUninitializedProject();
    void testLockTimeout();
    void testFailedStoreWriteRollsBackRegistry();

    // Focus and tasks
    void testFocusSwitch();
    void testFocusClaimedByOtherSession();
    void testComplete();
    void testEndAfterCompletingFocus();
    void testExplicitFocusOnDoneTask();
    void testAddTask();
    void testAutoSelectFocusOrdering();

    // Queries, backups, audit
    void testListAndHistory();
    void testRestoreBackup();
    void testAuditTrail();
    void testCurrentSession();
    void testInitIsIdempotent();
};

} // namespace Taskscope

#endif // SESSIONMANAGERTEST_H

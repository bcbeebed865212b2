/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "RetryPolicyTest.h"

// Qt
#include <QElapsedTimer>
#include <QStandardPaths>
#include <QTest>

// Taskscope
#include "../taskscope/RetryPolicy.h"
#include "../taskscope/SessionManager.h"

using namespace Taskscope;

void RetryPolicyTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void RetryPolicyTest::testDelayGrowsExponentially()
{
    RetryPolicy policy;
    QCOMPARE(policy.delayForRetry(0), 0);
    QCOMPARE(policy.delayForRetry(1), 100);
    QCOMPARE(policy.delayForRetry(2), 200);
    QCOMPARE(policy.delayForRetry(3), 400);
}

void RetryPolicyTest::testDelayCappedByTotalTime()
{
    RetryPolicy policy;
    policy.initialDelayMs = 4000;
    policy.maxTotalMs = 5000;
    QCOMPARE(policy.delayForRetry(1), 4000);
    QCOMPARE(policy.delayForRetry(2), 5000);
}

void RetryPolicyTest::testRetriesRecoverableFailures()
{
    RetryPolicy policy;
    policy.initialDelayMs = 1;

    int attempts = 0;
    const Status result = policy.run([&attempts]() {
        ++attempts;
        if (attempts < 3) {
            return Status(ErrorCode::LockTimeout, QStringLiteral("busy"));
        }
        return Status::ok();
    });

    QVERIFY(result.isOk());
    QCOMPARE(attempts, 3);
}

void RetryPolicyTest::testStopsOnPolicyFailure()
{
    RetryPolicy policy;
    policy.initialDelayMs = 1;

    int attempts = 0;
    const Status result = policy.run([&attempts]() {
        ++attempts;
        return Status(ErrorCode::ScopeConflict, QStringLiteral("overlap"));
    });

    QCOMPARE(result.code(), ErrorCode::ScopeConflict);
    QCOMPARE(attempts, 1);
}

void RetryPolicyTest::testGivesUpAfterMaxAttempts()
{
    RetryPolicy policy;
    policy.initialDelayMs = 1;
    policy.maxAttempts = 4;

    int attempts = 0;
    const Status result = policy.run([&attempts]() {
        ++attempts;
        return Status(ErrorCode::ChecksumMismatch, QStringLiteral("changed underneath"));
    });

    QCOMPARE(result.code(), ErrorCode::ChecksumMismatch);
    QCOMPARE(attempts, 4);
}

void RetryPolicyTest::testWallTimeCapStopsRetrying()
{
    RetryPolicy policy;
    policy.initialDelayMs = 50;
    policy.maxTotalMs = 10;

    int attempts = 0;
    QElapsedTimer timer;
    timer.start();
    const Status result = policy.run([&attempts]() {
        ++attempts;
        return Status(ErrorCode::LockTimeout, QStringLiteral("busy"));
    });

    QCOMPARE(result.code(), ErrorCode::LockTimeout);
    QCOMPARE(attempts, 1);
    QVERIFY(timer.elapsed() < 1000);
}

void RetryPolicyTest::testRetriesResultStructs()
{
    RetryPolicy policy;
    policy.initialDelayMs = 1;

    int attempts = 0;
    const TaskResult result = policy.run([&attempts]() {
        ++attempts;
        TaskResult r;
        if (attempts == 1) {
            r.status = Status(ErrorCode::IdCollision, QStringLiteral("taken"));
        } else {
            r.task.id = QStringLiteral("T001");
        }
        return r;
    });

    QVERIFY(result.status.isOk());
    QCOMPARE(result.task.id, QStringLiteral("T001"));
    QCOMPARE(attempts, 2);
}

void RetryPolicyTest::testRecoverableCategories()
{
    QVERIFY(Status(ErrorCode::LockTimeout, QString()).isRecoverable());
    QVERIFY(Status(ErrorCode::ChecksumMismatch, QString()).isRecoverable());
    QVERIFY(Status(ErrorCode::IdCollision, QString()).isRecoverable());

    QVERIFY(!Status::ok().isRecoverable());
    QVERIFY(!Status(ErrorCode::WriteFailed, QString()).isRecoverable());
    QVERIFY(!Status(ErrorCode::TaskClaimed, QString()).isRecoverable());
    QVERIFY(!Status(ErrorCode::ScopeInvalid, QString()).isRecoverable());
}

void RetryPolicyTest::testStableExitCodes()
{
    QCOMPARE(Status::ok().exitCode(), 0);
    QCOMPARE(Status(ErrorCode::LockTimeout, QString()).exitCode(), 8);
    QCOMPARE(Status(ErrorCode::SessionExists, QString()).exitCode(), 30);
    QCOMPARE(Status(ErrorCode::SessionNotFound, QString()).exitCode(), 31);
    QCOMPARE(Status(ErrorCode::ScopeConflict, QString()).exitCode(), 32);
    QCOMPARE(Status(ErrorCode::ScopeInvalid, QString()).exitCode(), 33);
    QCOMPARE(Status(ErrorCode::FocusNotInScope, QString()).exitCode(), 34);
    QCOMPARE(Status(ErrorCode::TaskClaimed, QString()).exitCode(), 35);
    QCOMPARE(Status(ErrorCode::SessionWrongState, QString()).exitCode(), 36);
    QCOMPARE(Status(ErrorCode::MaxSessions, QString()).exitCode(), 37);
    QCOMPARE(Status(ErrorCode::FocusRequired, QString()).exitCode(), 38);
}

void RetryPolicyTest::testCategoryNames()
{
    QCOMPARE(Status(ErrorCode::TaskClaimed, QString()).categoryName(), QStringLiteral("task-already-claimed"));
    QCOMPARE(Status(ErrorCode::MaxSessions, QString()).categoryName(), QStringLiteral("max-sessions-reached"));
    QCOMPARE(errorCodeName(ErrorCode::Ok), QStringLiteral("ok"));
    QCOMPARE(documentsWrittenName(DocumentsWritten::SessionRegistryOnly), QStringLiteral("session-registry"));

    Status status(ErrorCode::WriteFailed, QStringLiteral("disk full"));
    QCOMPARE(status.documentsWritten(), DocumentsWritten::Neither);
    status.setDocumentsWritten(DocumentsWritten::SessionRegistryOnly);
    QCOMPARE(status.documentsWritten(), DocumentsWritten::SessionRegistryOnly);
    QCOMPARE(status.message(), QStringLiteral("disk full"));
}

QTEST_GUILESS_MAIN(RetryPolicyTest)

#include "moc_RetryPolicyTest.cpp"

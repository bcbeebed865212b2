/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "AuditLogTest.h"

// Qt
#include <QFile>
#include <QJsonObject>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

// Taskscope
#include "../taskscope/AuditLog.h"

using namespace Taskscope;

void AuditLogTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void AuditLogTest::testAppendAndRead()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AuditLog log(dir.filePath(QStringLiteral(".taskscope/audit-log.jsonl")));

    QJsonObject details;
    details[QStringLiteral("scopeType")] = QStringLiteral("task");
    QVERIFY(log.append(QStringLiteral("session_start"), QStringLiteral("session_a"), QStringLiteral("T010"), details, QStringLiteral("agent")));
    QVERIFY(log.append(QStringLiteral("session_end"), QStringLiteral("session_a")));

    const QList<AuditEvent> events = log.entries();
    QCOMPARE(events.size(), 2);

    const AuditEvent &first = events.at(0);
    QCOMPARE(first.action, QStringLiteral("session_start"));
    QCOMPARE(first.sessionId, QStringLiteral("session_a"));
    QCOMPARE(first.taskId, QStringLiteral("T010"));
    QCOMPARE(first.actor, QStringLiteral("agent"));
    QCOMPARE(first.details.value(QStringLiteral("scopeType")).toString(), QStringLiteral("task"));
    QVERIFY(first.timestamp.isValid());

    QCOMPARE(events.at(1).actor, QStringLiteral("system"));
    QVERIFY(events.at(1).taskId.isEmpty());
    QVERIFY(events.at(0).id != events.at(1).id);

    // One JSON object per line
    QFile file(log.path());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QList<QByteArray> lines = file.readAll().trimmed().split('\n');
    QCOMPARE(lines.size(), 2);
}

void AuditLogTest::testRejectsUnknownAction()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AuditLog log(dir.filePath(QStringLiteral("audit-log.jsonl")));

    QVERIFY(!log.append(QStringLiteral("session_teleport")));
    QVERIFY(!QFile::exists(log.path()));
    QVERIFY(AuditLog::isKnownAction(QStringLiteral("backup_restored")));
    QVERIFY(!AuditLog::isKnownAction(QString()));
}

void AuditLogTest::testRejectsUnknownActor()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AuditLog log(dir.filePath(QStringLiteral("audit-log.jsonl")));

    QVERIFY(!log.append(QStringLiteral("focus_changed"), QString(), QString(), QJsonObject(), QStringLiteral("robot")));
    QVERIFY(log.entries().isEmpty());
    QVERIFY(AuditLog::isKnownActor(QStringLiteral("human")));
}

void AuditLogTest::testSkipsMalformedLines()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AuditLog log(dir.filePath(QStringLiteral("audit-log.jsonl")));

    QVERIFY(log.append(QStringLiteral("task_created"), QString(), QStringLiteral("T001")));
    {
        QFile file(log.path());
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Append));
        QVERIFY(file.write("{\"action\": \"session_st\n\n") > 0);
    }
    QVERIFY(log.append(QStringLiteral("task_created"), QString(), QStringLiteral("T002")));

    const QList<AuditEvent> events = log.entries();
    QCOMPARE(events.size(), 2);
    QCOMPARE(events.at(1).taskId, QStringLiteral("T002"));
}

void AuditLogTest::testGenerateId()
{
    const QRegularExpression pattern(QStringLiteral("^log_[0-9a-f]{12}$"));
    for (int i = 0; i < 20; ++i) {
        const QString id = AuditLog::generateId();
        QVERIFY2(pattern.match(id).hasMatch(), qPrintable(id));
    }
}

QTEST_GUILESS_MAIN(AuditLogTest)

#include "moc_AuditLogTest.cpp"

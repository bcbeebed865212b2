/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "DocumentValidatorTest.h"

// Qt
#include <QJsonDocument>
#include <QStandardPaths>
#include <QTest>

// Taskscope
#include "../taskscope/DocumentValidator.h"

using namespace Taskscope;

namespace
{

QJsonDocument parse(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json));
}

bool mentions(const ValidationResult &result, const QString &needle)
{
    for (const QString &error : result.errors) {
        if (error.contains(needle)) {
            return true;
        }
    }
    return false;
}

}

void DocumentValidatorTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void DocumentValidatorTest::testSyntax()
{
    const JsonSyntaxValidator validator;
    QVERIFY(validator.validate(parse(R"({"a": 1})")).isValid());
    QVERIFY(!validator.validate(parse("[1, 2]")).isValid());
    QVERIFY(!validator.validate(parse("{}")).isValid());
    QVERIFY(!validator.validate(QJsonDocument()).isValid());
}

void DocumentValidatorTest::testValidTaskStore()
{
    const ValidationResult result = TaskStoreValidator().validate(parse(R"({
        "tasks": [
            {"id": "T001", "status": "pending", "priority": "critical"},
            {"id": "T002", "status": "done", "parentId": "T001"},
            {"id": "T003", "status": "blocked", "parentId": null}
        ]
    })"));
    QVERIFY2(result.isValid(), qPrintable(result.errors.join(QStringLiteral("; "))));
}

void DocumentValidatorTest::testTaskStoreErrors()
{
    const TaskStoreValidator validator;

    QVERIFY(mentions(validator.validate(parse(R"({"project": "x"})")), QStringLiteral("tasks")));

    const ValidationResult result = validator.validate(parse(R"({
        "tasks": [
            {"id": "T001", "status": "pending"},
            {"id": "T001", "status": "pending"},
            {"id": "T002", "status": "started"},
            {"id": "T003", "status": "pending", "priority": "urgent"},
            {"id": "T004", "status": "pending", "parentId": "T404"},
            {"id": "T005", "status": "pending", "parentId": "T005"},
            {"status": "pending"}
        ]
    })"));

    QVERIFY(!result.isValid());
    QVERIFY(mentions(result, QStringLiteral("duplicate task id T001")));
    QVERIFY(mentions(result, QStringLiteral("started")));
    QVERIFY(mentions(result, QStringLiteral("urgent")));
    QVERIFY(mentions(result, QStringLiteral("missing parent T404")));
    QVERIFY(mentions(result, QStringLiteral("T005 is its own parent")));
    QVERIFY(mentions(result, QStringLiteral("without id")));
}

void DocumentValidatorTest::testValidSessionRegistry()
{
    const ValidationResult result = SessionRegistryValidator().validate(parse(R"({
        "config": {"maxConcurrentSessions": 5},
        "sessions": [
            {"id": "session_a", "status": "active", "scope": {"type": "subtree", "computedTaskIds": ["T001", "T002"]}},
            {"id": "session_b", "status": "suspended", "scope": {"type": "custom", "computedTaskIds": ["T010"]}}
        ],
        "sessionHistory": []
    })"));
    QVERIFY2(result.isValid(), qPrintable(result.errors.join(QStringLiteral("; "))));
}

void DocumentValidatorTest::testSessionRegistryErrors()
{
    const SessionRegistryValidator validator;

    QVERIFY(mentions(validator.validate(parse(R"({"sessionHistory": []})")), QStringLiteral("sessions")));

    const ValidationResult result = validator.validate(parse(R"({
        "config": [],
        "sessionHistory": {},
        "sessions": [
            {"id": "session_a", "status": "active", "scope": {"type": "task", "computedTaskIds": ["T001"]}},
            {"id": "session_a", "status": "active", "scope": {"type": "task", "computedTaskIds": ["T002"]}},
            {"id": "session_b", "status": "ended", "scope": {"type": "task", "computedTaskIds": ["T003"]}},
            {"id": "session_c", "status": "active", "scope": {"type": "galaxy", "computedTaskIds": ["T004"]}},
            {"id": "session_d", "status": "active", "scope": {"type": "task", "computedTaskIds": []}}
        ]
    })"));

    QVERIFY(!result.isValid());
    QVERIFY(mentions(result, QStringLiteral("\"config\"")));
    QVERIFY(mentions(result, QStringLiteral("\"sessionHistory\"")));
    QVERIFY(mentions(result, QStringLiteral("duplicate session id session_a")));
    QVERIFY(mentions(result, QStringLiteral("session_b has unknown status")));
    QVERIFY(mentions(result, QStringLiteral("session_c has unknown scope type")));
    QVERIFY(mentions(result, QStringLiteral("session_d claims no tasks")));
}

QTEST_GUILESS_MAIN(DocumentValidatorTest)

#include "moc_DocumentValidatorTest.cpp"

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    taskscope - command line front end for the session engine

    Every command prints a JSON object on stdout. Failures print a message on
    stderr and exit with the numeric error code (e.g. 35 for a task already
    claimed by another session).

    Usage:
        taskscope [--project <dir>] <command> [args]

    Commands:
        init                         create .taskscope/ documents
        add --title <t> [--parent <id>] [--priority <p>] [--phase <p>]
        start --scope <type> [--root <id>] [--focus <id>] ...
        suspend [session] [--note <text>]
        resume [session]
        end [session] [--note <text>]
        focus <task> [--session <id>]
        complete <task> [--session <id>]
        list [--filter active|suspended|all]
        show [session]
        history
        backups [--document todo|sessions]
        restore --document todo|sessions [--number <n>]
*/

#include "SessionManager.h"
#include "TaskscopeSettings.h"

#include <KLocalizedString>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <utility>

using namespace Taskscope;

namespace
{

QJsonArray toJsonArray(const QStringList &list)
{
    QJsonArray array;
    for (const QString &value : list) {
        array.append(value);
    }
    return array;
}

QStringList splitIds(const QString &value)
{
    QStringList ids;
    const QStringList parts = value.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QString id = part.trimmed();
        if (!id.isEmpty()) {
            ids.append(id);
        }
    }
    return ids;
}

void printJson(const QJsonObject &obj)
{
    QTextStream out(stdout);
    out << QJsonDocument(obj).toJson(QJsonDocument::Indented);
}

int fail(const Status &status)
{
    QTextStream err(stderr);
    err << i18n("Error (%1): %2", status.categoryName(), status.message()) << "\n";
    if (status.documentsWritten() != DocumentsWritten::Neither) {
        err << i18n("Documents written before the failure: %1", documentsWrittenName(status.documentsWritten())) << "\n";
    }
    return status.exitCode();
}

int usageError(const QString &message)
{
    return fail(Status(ErrorCode::InvalidArgument, message));
}

QJsonObject conflictsToJson(const SessionResult &result)
{
    QJsonObject obj;
    QJsonArray conflicts;
    for (const ConflictReport &report : result.conflicts) {
        QJsonObject entry;
        entry[QStringLiteral("type")] = ConflictReport::typeToString(report.type);
        entry[QStringLiteral("sessionId")] = report.sessionId;
        entry[QStringLiteral("overlap")] = toJsonArray(report.overlap);
        entry[QStringLiteral("message")] = report.message;
        conflicts.append(entry);
    }
    obj[QStringLiteral("conflicts")] = conflicts;
    obj[QStringLiteral("warnings")] = toJsonArray(result.warnings);
    return obj;
}

int reportSession(const SessionResult &result)
{
    if (!result.status.isOk()) {
        if (!result.conflicts.isEmpty()) {
            QTextStream err(stderr);
            err << QJsonDocument(conflictsToJson(result)).toJson(QJsonDocument::Compact) << "\n";
        }
        return fail(result.status);
    }

    QJsonObject out = conflictsToJson(result);
    out[QStringLiteral("success")] = true;
    out[QStringLiteral("session")] = result.session.toJson();
    printJson(out);
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("taskscope"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    KLocalizedString::setApplicationDomain("taskscope");

    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Multi-session task scope manager"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), i18n("init, add, start, suspend, resume, end, focus, complete, list, show, history, backups, restore"));
    parser.addPositionalArgument(QStringLiteral("argument"), i18n("Session or task id, depending on the command"), QStringLiteral("[argument]"));

    QCommandLineOption projectOption(QStringList() << QStringLiteral("p") << QStringLiteral("project"),
                                     i18n("Project directory (default: current directory)"),
                                     QStringLiteral("dir"));
    QCommandLineOption scopeOption(QStringLiteral("scope"), i18n("Scope type: task, taskGroup, subtree, epicPhase, epic, custom"), QStringLiteral("type"));
    QCommandLineOption rootOption(QStringLiteral("root"), i18n("Root task of the scope"), QStringLiteral("id"));
    QCommandLineOption phaseOption(QStringLiteral("phase"), i18n("Phase filter (epicPhase scopes) or phase of a new task"), QStringLiteral("phase"));
    QCommandLineOption maxDepthOption(QStringLiteral("max-depth"), i18n("Descendant depth limit of the scope"), QStringLiteral("n"));
    QCommandLineOption excludeOption(QStringLiteral("exclude"), i18n("Comma separated task ids to leave out of the scope"), QStringLiteral("ids"));
    QCommandLineOption tasksOption(QStringLiteral("tasks"), i18n("Comma separated task ids of a custom scope"), QStringLiteral("ids"));
    QCommandLineOption focusOption(QStringLiteral("focus"), i18n("Initial focus task (default: highest priority pending task)"), QStringLiteral("id"));
    QCommandLineOption nameOption(QStringLiteral("name"), i18n("Session name"), QStringLiteral("name"));
    QCommandLineOption agentOption(QStringLiteral("agent"), i18n("Agent identifier"), QStringLiteral("id"));
    QCommandLineOption noteOption(QStringLiteral("note"), i18n("Note stored with the session"), QStringLiteral("text"));
    QCommandLineOption sessionOption(QStringLiteral("session"), i18n("Session id (default: current session)"), QStringLiteral("id"));
    QCommandLineOption filterOption(QStringLiteral("filter"), i18n("Sessions to list: active, suspended, all"), QStringLiteral("filter"), QStringLiteral("all"));
    QCommandLineOption titleOption(QStringLiteral("title"), i18n("Title of a new task"), QStringLiteral("title"));
    QCommandLineOption parentOption(QStringLiteral("parent"), i18n("Parent of a new task"), QStringLiteral("id"));
    QCommandLineOption priorityOption(QStringLiteral("priority"), i18n("Priority of a new task"), QStringLiteral("priority"), QStringLiteral("medium"));
    QCommandLineOption documentOption(QStringLiteral("document"), i18n("Document for backups/restore: todo or sessions"), QStringLiteral("name"), QStringLiteral("todo"));
    QCommandLineOption numberOption(QStringLiteral("number"), i18n("Backup number to restore (default: latest)"), QStringLiteral("n"), QStringLiteral("0"));

    parser.addOptions({projectOption,
                       scopeOption,
                       rootOption,
                       phaseOption,
                       maxDepthOption,
                       excludeOption,
                       tasksOption,
                       focusOption,
                       nameOption,
                       agentOption,
                       noteOption,
                       sessionOption,
                       filterOption,
                       titleOption,
                       parentOption,
                       priorityOption,
                       documentOption,
                       numberOption});

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        return usageError(i18n("No command given, see --help"));
    }
    const QString command = args.at(0);
    const QString argument = args.size() > 1 ? args.at(1) : QString();

    const QString projectDir = parser.isSet(projectOption) ? parser.value(projectOption) : QDir::currentPath();

    TaskscopeSettings settings;
    SessionManager manager(projectDir, &settings);

    auto sessionArgument = [&]() {
        if (!argument.isEmpty()) {
            return argument;
        }
        if (parser.isSet(sessionOption)) {
            return parser.value(sessionOption);
        }
        return manager.currentSessionId();
    };

    if (command == QLatin1String("init")) {
        const Status status = manager.init();
        if (!status.isOk()) {
            return fail(status);
        }
        QJsonObject out;
        out[QStringLiteral("success")] = true;
        out[QStringLiteral("taskStore")] = manager.taskStorePath();
        out[QStringLiteral("sessionRegistry")] = manager.sessionRegistryPath();
        printJson(out);
        return 0;
    }

    if (command == QLatin1String("add")) {
        Task task;
        task.title = parser.value(titleOption);
        task.parentId = parser.value(parentOption);
        task.priority = parser.value(priorityOption);
        task.phase = parser.value(phaseOption);
        const TaskResult result = manager.addTask(task);
        if (!result.status.isOk()) {
            return fail(result.status);
        }
        QJsonObject out;
        out[QStringLiteral("success")] = true;
        out[QStringLiteral("task")] = result.task.toJson();
        printJson(out);
        return 0;
    }

    if (command == QLatin1String("start")) {
        StartRequest request;
        if (!ScopeDeclaration::typeFromString(parser.value(scopeOption), &request.scope.type)) {
            return usageError(i18n("Unknown or missing scope type \"%1\"", parser.value(scopeOption)));
        }
        request.scope.rootTaskId = parser.value(rootOption);
        request.scope.phaseFilter = parser.value(phaseOption);
        request.scope.maxDepth = settings.defaultScopeDepth();
        if (parser.isSet(maxDepthOption)) {
            bool ok = false;
            request.scope.maxDepth = parser.value(maxDepthOption).toInt(&ok);
            if (!ok || request.scope.maxDepth < 0) {
                return usageError(i18n("--max-depth needs a non-negative number"));
            }
        }
        request.scope.excludeTaskIds = splitIds(parser.value(excludeOption));
        request.scope.taskIds = splitIds(parser.value(tasksOption));
        request.focusTaskId = parser.value(focusOption);
        request.name = parser.value(nameOption);
        request.agentId = parser.value(agentOption);

        const SessionResult result = manager.start(request);
        if (result.status.isOk()) {
            const Status stored = manager.setCurrentSessionId(result.session.id);
            if (!stored.isOk()) {
                QTextStream err(stderr);
                err << i18n("Warning: %1", stored.message()) << "\n";
            }
        }
        return reportSession(result);
    }

    if (command == QLatin1String("suspend") || command == QLatin1String("resume") || command == QLatin1String("end")) {
        const QString sessionId = sessionArgument();
        if (sessionId.isEmpty()) {
            return fail(Status(ErrorCode::SessionNotFound, i18n("No session given and no current session set")));
        }
        if (command == QLatin1String("suspend")) {
            return reportSession(manager.suspend(sessionId, parser.value(noteOption)));
        }
        if (command == QLatin1String("resume")) {
            return reportSession(manager.resume(sessionId));
        }
        return reportSession(manager.end(sessionId, parser.value(noteOption)));
    }

    if (command == QLatin1String("focus") || command == QLatin1String("complete")) {
        if (argument.isEmpty()) {
            return usageError(i18n("%1 needs a task id", command));
        }
        const QString sessionId = parser.isSet(sessionOption) ? parser.value(sessionOption) : manager.currentSessionId();
        if (sessionId.isEmpty()) {
            return fail(Status(ErrorCode::SessionNotFound, i18n("No session given and no current session set")));
        }
        if (command == QLatin1String("focus")) {
            return reportSession(manager.focus(sessionId, argument));
        }
        return reportSession(manager.complete(sessionId, argument));
    }

    if (command == QLatin1String("list")) {
        const QString filterName = parser.value(filterOption);
        SessionManager::SessionFilter filter = SessionManager::AllSessions;
        if (filterName == QLatin1String("active")) {
            filter = SessionManager::ActiveSessions;
        } else if (filterName == QLatin1String("suspended")) {
            filter = SessionManager::SuspendedSessions;
        } else if (filterName != QLatin1String("all")) {
            return usageError(i18n("Unknown filter \"%1\"", filterName));
        }

        QList<Session> sessions;
        const Status status = manager.listSessions(filter, &sessions);
        if (!status.isOk()) {
            return fail(status);
        }
        QJsonArray array;
        for (const Session &session : std::as_const(sessions)) {
            array.append(session.toJson());
        }
        QJsonObject out;
        out[QStringLiteral("success")] = true;
        out[QStringLiteral("count")] = array.size();
        out[QStringLiteral("sessions")] = array;
        printJson(out);
        return 0;
    }

    if (command == QLatin1String("show")) {
        const QString sessionId = sessionArgument();
        if (sessionId.isEmpty()) {
            return fail(Status(ErrorCode::SessionNotFound, i18n("No session given and no current session set")));
        }
        Session session;
        const Status status = manager.session(sessionId, &session);
        if (!status.isOk()) {
            return fail(status);
        }
        QJsonObject out;
        out[QStringLiteral("success")] = true;
        out[QStringLiteral("session")] = session.toJson();
        printJson(out);
        return 0;
    }

    if (command == QLatin1String("history")) {
        QList<SessionHistoryEntry> entries;
        const Status status = manager.history(&entries);
        if (!status.isOk()) {
            return fail(status);
        }
        QJsonArray array;
        for (const SessionHistoryEntry &entry : std::as_const(entries)) {
            array.append(entry.toJson());
        }
        QJsonObject out;
        out[QStringLiteral("success")] = true;
        out[QStringLiteral("history")] = array;
        printJson(out);
        return 0;
    }

    if (command == QLatin1String("backups") || command == QLatin1String("restore")) {
        const QString document = parser.value(documentOption);
        QString path;
        if (document == QLatin1String("todo")) {
            path = manager.taskStorePath();
        } else if (document == QLatin1String("sessions")) {
            path = manager.sessionRegistryPath();
        } else {
            return usageError(i18n("Unknown document \"%1\", use todo or sessions", document));
        }

        if (command == QLatin1String("restore")) {
            const Status status = manager.restoreBackup(path, parser.value(numberOption).toInt());
            if (!status.isOk()) {
                return fail(status);
            }
            QJsonObject out;
            out[QStringLiteral("success")] = true;
            out[QStringLiteral("restored")] = path;
            printJson(out);
            return 0;
        }

        const QList<BackupInfo> backups = manager.backupManager()->listBackups(path);
        QJsonArray array;
        for (const BackupInfo &backup : backups) {
            QJsonObject entry;
            entry[QStringLiteral("number")] = backup.number;
            entry[QStringLiteral("path")] = backup.path;
            entry[QStringLiteral("modified")] = isoTimestamp(backup.modified);
            entry[QStringLiteral("size")] = backup.size;
            array.append(entry);
        }
        QJsonObject out;
        out[QStringLiteral("success")] = true;
        out[QStringLiteral("backups")] = array;
        printJson(out);
        return 0;
    }

    return usageError(i18n("Unknown command \"%1\"", command));
}

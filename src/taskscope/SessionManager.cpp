/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionManager.h"
#include "AtomicWriter.h"
#include "DocumentRepository.h"
#include "FileLock.h"
#include "ScopeResolver.h"
#include "TaskscopeSettings.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QSaveFile>

#include <algorithm>
#include <utility>

namespace Taskscope
{

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

Status notFound(const QString &sessionId)
{
    return Status(ErrorCode::SessionNotFound, QStringLiteral("no live session %1").arg(sessionId));
}
}

SessionManager::SessionManager(const QString &projectDir, TaskscopeSettings *settings, QObject *parent)
    : QObject(parent)
    , m_projectDir(QDir(projectDir).absolutePath())
    , m_audit(dataDirFor(projectDir) + QStringLiteral("/audit-log.jsonl"))
    , m_writer(std::make_unique<AtomicWriter>(&m_backups))
{
    if (settings) {
        m_retry = settings->retryPolicy();
        m_lockTimeoutMs = settings->lockTimeoutMs();
        m_staleLockMs = settings->staleLockMs();
        m_backups = BackupManager(settings->backupDirName(), settings->maxBackups());
        m_hierarchy.maxDepth = settings->hierarchyMaxDepth();
        m_hierarchy.maxSiblings = settings->hierarchyMaxSiblings();
        m_hierarchy.countDoneInLimit = settings->countDoneInSiblingLimit();
        m_registryDefaults = settings->registryDefaults();
    }
    m_backups.setAuditLog(&m_audit);
    rebuildRepositories();
}

SessionManager::~SessionManager() = default;

QString SessionManager::dataDirFor(const QString &projectDir)
{
    return QDir(projectDir).absoluteFilePath(QStringLiteral(".taskscope"));
}

QString SessionManager::dataDir() const
{
    return dataDirFor(m_projectDir);
}

QString SessionManager::taskStorePath() const
{
    return dataDir() + QStringLiteral("/todo.json");
}

QString SessionManager::sessionRegistryPath() const
{
    return dataDir() + QStringLiteral("/sessions.json");
}

QString SessionManager::auditLogPath() const
{
    return m_audit.path();
}

void SessionManager::setAtomicWriter(std::unique_ptr<AtomicWriter> writer)
{
    if (!writer) {
        return;
    }
    m_writer = std::move(writer);
    rebuildRepositories();
}

void SessionManager::rebuildRepositories()
{
    m_storeRepo = std::make_unique<DocumentRepository>(taskStorePath(), QStringLiteral("tasks"), &m_storeValidator, m_writer.get());
    m_registryRepo = std::make_unique<DocumentRepository>(sessionRegistryPath(), QStringLiteral("sessions"), &m_registryValidator, m_writer.get());
}

bool SessionManager::isInitialized() const
{
    return m_storeRepo->exists() && m_registryRepo->exists();
}

QString SessionManager::actorFor(const QString &agentId)
{
    return agentId.isEmpty() ? QStringLiteral("human") : QStringLiteral("agent");
}

void SessionManager::record(const QString &action, const QString &sessionId, const QString &taskId, const QJsonObject &details, const QString &actor)
{
    if (!m_audit.append(action, sessionId, taskId, details, actor)) {
        qWarning() << "SessionManager: Could not record" << action << "in" << m_audit.path();
    }
}

void SessionManager::recordFailure(const QString &operation, const QString &sessionId, const Status &status)
{
    if (status.isOk() || !isInitialized()) {
        return;
    }
    QJsonObject details;
    details[QStringLiteral("operation")] = operation;
    details[QStringLiteral("code")] = status.exitCode();
    details[QStringLiteral("category")] = status.categoryName();
    details[QStringLiteral("message")] = status.message();
    record(QStringLiteral("error_occurred"), sessionId, QString(), details, QStringLiteral("system"));
}

// ========== Document access ==========

Status SessionManager::loadRegistry(SessionRegistry *registry) const
{
    QJsonDocument doc;
    const Status status = m_registryRepo->load(&doc);
    if (!status.isOk()) {
        return status;
    }
    return SessionRegistry::fromJson(doc, registry);
}

Status SessionManager::loadStore(TaskStore *store) const
{
    QJsonDocument doc;
    const Status status = m_storeRepo->load(&doc);
    if (!status.isOk()) {
        return status;
    }
    return TaskStore::fromJson(doc, store);
}

Status SessionManager::readRegistryLocked(SessionRegistry *registry)
{
    if (!m_registryRepo->exists()) {
        return Status(ErrorCode::FileNotFound, QStringLiteral("no session registry in %1, run init first").arg(dataDir()));
    }

    FileLock lock(sessionRegistryPath());
    lock.setStaleLockTime(m_staleLockMs);
    const Status locked = lock.acquire(m_lockTimeoutMs);
    if (!locked.isOk()) {
        return locked;
    }
    return loadRegistry(registry);
}

Status SessionManager::transact(const Mutation &mutate)
{
    if (!isInitialized()) {
        return Status(ErrorCode::FileNotFound, QStringLiteral("project in %1 is not initialized, run init first").arg(m_projectDir));
    }

    // Registry before store, always
    FileLock registryLock(sessionRegistryPath());
    registryLock.setStaleLockTime(m_staleLockMs);
    Status status = registryLock.acquire(m_lockTimeoutMs);
    if (!status.isOk()) {
        return status;
    }

    FileLock storeLock(taskStorePath());
    storeLock.setStaleLockTime(m_staleLockMs);
    status = storeLock.acquire(m_lockTimeoutMs);
    if (!status.isOk()) {
        return status;
    }

    SessionRegistry registry;
    status = loadRegistry(&registry);
    if (!status.isOk()) {
        return status;
    }

    TaskStore store;
    status = loadStore(&store);
    if (!status.isOk()) {
        return status;
    }

    const QString registryChecksum = registry.storedChecksum();
    const QString storeChecksum = store.storedChecksum();

    bool storeChanged = false;
    status = mutate(registry, store, &storeChanged);
    if (!status.isOk()) {
        return status;
    }

    return commit(registry, store, storeChanged, registryChecksum, storeChecksum);
}

Status SessionManager::commit(const SessionRegistry &registry,
                              const TaskStore &store,
                              bool storeChanged,
                              const QString &registryChecksum,
                              const QString &storeChecksum)
{
    const QJsonDocument registryDoc = registry.toJson();
    const QJsonDocument storeDoc = store.toJson();

    // Both documents must be acceptable before either is touched
    ValidationResult check = m_registryValidator.validate(registryDoc);
    if (!check.isValid()) {
        return Status(ErrorCode::ValidationFailed, QStringLiteral("session registry: %1").arg(check.errors.join(QStringLiteral("; "))));
    }
    if (storeChanged) {
        check = m_storeValidator.validate(storeDoc);
        if (!check.isValid()) {
            return Status(ErrorCode::ValidationFailed, QStringLiteral("task store: %1").arg(check.errors.join(QStringLiteral("; "))));
        }
    }

    QString onDisk;
    Status status = m_registryRepo->diskChecksum(&onDisk);
    if (!status.isOk()) {
        return status;
    }
    if (onDisk != registryChecksum) {
        qWarning() << "SessionManager: Session registry changed underneath the lock";
        return Status(ErrorCode::ChecksumMismatch, QStringLiteral("session registry was modified by another writer"));
    }
    if (storeChanged) {
        status = m_storeRepo->diskChecksum(&onDisk);
        if (!status.isOk()) {
            return status;
        }
        if (onDisk != storeChecksum) {
            qWarning() << "SessionManager: Task store changed underneath the lock";
            return Status(ErrorCode::ChecksumMismatch, QStringLiteral("task store was modified by another writer"));
        }
    }

    status = m_registryRepo->write(registryDoc);
    if (!status.isOk()) {
        return status;
    }
    const QString registryBackup = m_writer->lastBackupPath();

    Status done = Status::ok();
    if (!storeChanged) {
        done.setDocumentsWritten(DocumentsWritten::SessionRegistryOnly);
        return done;
    }

    status = m_storeRepo->write(storeDoc);
    if (status.isOk()) {
        done.setDocumentsWritten(DocumentsWritten::Both);
        return done;
    }

    qWarning() << "SessionManager: Task store write failed, rolling back session registry:" << status.message();

    Status failure(status.code(), status.message());
    failure.setDocumentsWritten(DocumentsWritten::SessionRegistryOnly);

    QFile backup(registryBackup);
    if (!registryBackup.isEmpty() && backup.open(QIODevice::ReadOnly)) {
        const QByteArray previous = backup.readAll();
        backup.close();
        const Status rollback = m_writer->write(sessionRegistryPath(), previous, m_registryValidator);
        if (rollback.isOk()) {
            failure.setDocumentsWritten(DocumentsWritten::Neither);
        } else {
            qWarning() << "SessionManager: Rollback of session registry failed:" << rollback.message();
        }
    }
    return failure;
}

// ========== Initialisation ==========

Status SessionManager::init(const QString &projectName)
{
    const QString name = projectName.isEmpty() ? QDir(m_projectDir).dirName() : projectName;

    if (!QDir().mkpath(dataDir())) {
        return Status(ErrorCode::WriteFailed, QStringLiteral("cannot create %1").arg(dataDir()));
    }

    FileLock registryLock(sessionRegistryPath());
    registryLock.setStaleLockTime(m_staleLockMs);
    Status status = registryLock.acquire(m_lockTimeoutMs);
    if (!status.isOk()) {
        return status;
    }

    FileLock storeLock(taskStorePath());
    storeLock.setStaleLockTime(m_staleLockMs);
    status = storeLock.acquire(m_lockTimeoutMs);
    if (!status.isOk()) {
        return status;
    }

    bool registryCreated = false;
    if (!m_registryRepo->exists()) {
        status = m_registryRepo->write(SessionRegistry::createEmpty(name, m_registryDefaults).toJson());
        if (!status.isOk()) {
            return status;
        }
        registryCreated = true;
    }

    if (!m_storeRepo->exists()) {
        status = m_storeRepo->write(TaskStore::createEmpty(name).toJson());
        if (!status.isOk()) {
            status.setDocumentsWritten(registryCreated ? DocumentsWritten::SessionRegistryOnly : DocumentsWritten::Neither);
            return status;
        }
    }

    qDebug() << "SessionManager: Initialized" << dataDir();
    return Status::ok();
}

// ========== Lifecycle ==========

QString SessionManager::autoSelectFocus(const TaskStore &store, const QStringList &candidateIds)
{
    QList<const Task *> pending;
    for (const QString &id : candidateIds) {
        const Task *task = store.task(id);
        if (task && task->status == TaskStatus::Pending) {
            pending.append(task);
        }
    }

    if (pending.isEmpty()) {
        return QString();
    }

    std::stable_sort(pending.begin(), pending.end(), [](const Task *a, const Task *b) {
        const int rankA = Task::priorityRank(a->priority);
        const int rankB = Task::priorityRank(b->priority);
        if (rankA != rankB) {
            return rankA > rankB;
        }
        // Missing creation times sort last
        if (a->createdAt.isValid() != b->createdAt.isValid()) {
            return a->createdAt.isValid();
        }
        return a->createdAt < b->createdAt;
    });

    return pending.first()->id;
}

SessionResult SessionManager::start(const StartRequest &request)
{
    SessionResult result = m_retry.run([&]() {
        return startOnce(request);
    });

    if (!result.status.isOk()) {
        qWarning() << "SessionManager: start failed:" << result.status.categoryName() << result.status.message();
        recordFailure(QStringLiteral("start"), QString(), result.status);
        return result;
    }

    const Session &session = result.session;
    qDebug() << "SessionManager: Started" << session.id << "focused on" << session.focus.currentTask;

    QJsonObject details;
    details[QStringLiteral("scopeType")] = ScopeDeclaration::typeToString(session.scope.type);
    details[QStringLiteral("rootTaskId")] = session.scope.rootTaskId;
    details[QStringLiteral("computedTaskIds")] = toJsonArray(session.scope.computedTaskIds);
    if (!result.warnings.isEmpty()) {
        details[QStringLiteral("warnings")] = toJsonArray(result.warnings);
    }
    record(QStringLiteral("session_start"), session.id, session.focus.currentTask, details, actorFor(session.agentId));

    Q_EMIT sessionStarted(session.id, session.focus.currentTask);
    return result;
}

SessionResult SessionManager::startOnce(const StartRequest &request)
{
    SessionResult result;
    const QDateTime now = QDateTime::currentDateTimeUtc();

    result.status = transact([&](SessionRegistry &registry, TaskStore &store, bool *storeChanged) -> Status {
        const RegistryConfig &config = registry.config();

        if (registry.liveCount() >= config.maxConcurrentSessions) {
            return Status(ErrorCode::MaxSessions, QStringLiteral("%1 live sessions, maximum is %2").arg(registry.liveCount()).arg(config.maxConcurrentSessions));
        }

        const ResolvedScope resolved = ScopeResolver::resolve(store, request.scope);
        if (!resolved.status.isOk()) {
            return resolved.status;
        }

        QString focusId = request.focusTaskId;
        if (!focusId.isEmpty()) {
            if (!resolved.taskIds.contains(focusId)) {
                return Status(ErrorCode::FocusNotInScope, QStringLiteral("task %1 is not in the requested scope").arg(focusId));
            }
            const Task *focusTask = store.task(focusId);
            if (focusTask && focusTask->status == TaskStatus::Done) {
                return Status(ErrorCode::InvalidArgument, QStringLiteral("task %1 is already done").arg(focusId));
            }
        } else {
            focusId = autoSelectFocus(store, resolved.taskIds);
            if (focusId.isEmpty()) {
                // Nothing pending: if the scope's work is claimed elsewhere, say so
                for (const QString &id : resolved.taskIds) {
                    const Session *owner = registry.focusOwner(id, true);
                    if (owner) {
                        ConflictReport report;
                        report.type = ConflictReport::Hard;
                        report.sessionId = owner->id;
                        report.overlap = QStringList{id};
                        report.message = QStringLiteral("task %1 is already the focus of session %2").arg(id, owner->id);
                        result.conflicts.append(report);
                        return Status(ErrorCode::TaskClaimed, report.message);
                    }
                }
                return Status(ErrorCode::FocusRequired, QStringLiteral("focus required and none could be inferred: no pending task in scope"));
            }
        }

        result.conflicts = ConflictDetector::detectAll(registry.activeSessions(), resolved.taskIds, focusId);
        for (const ConflictReport &report : std::as_const(result.conflicts)) {
            const ConflictDecision decision = ConflictDetector::evaluate(report, config);
            if (!decision.allowed) {
                return decision.status;
            }
            if (!decision.warning.isEmpty()) {
                result.warnings.append(decision.warning);
            }
        }

        Session session;
        session.id = Session::generateId(now);
        if (registry.contains(session.id) || registry.historyContains(session.id)) {
            return Status(ErrorCode::IdCollision, QStringLiteral("generated session id %1 is already taken").arg(session.id));
        }
        session.status = Session::Active;
        session.name = request.name;
        session.agentId = request.agentId;
        session.scope = request.scope;
        session.scope.computedTaskIds = resolved.taskIds;
        session.focus.currentTask = focusId;
        session.focus.focusHistory.append(FocusEvent{focusId, now, QStringLiteral("focused")});
        session.stats.focusChanges = 1;
        session.startedAt = now;
        session.lastActivity = now;

        registry.addSession(session);
        registry.touch(now);

        // Active tasks in the new scope that nobody focuses are leftovers
        for (const QString &id : resolved.taskIds) {
            const Task *task = store.task(id);
            if (!task || id == focusId || task->status != TaskStatus::Active) {
                continue;
            }
            if (registry.focusOwner(id, false, session.id)) {
                continue;
            }
            store.setStatus(id, TaskStatus::Pending, now);
            result.warnings.append(QStringLiteral("task %1 was active without an owner and has been reset to pending").arg(id));
        }

        store.setStatus(focusId, TaskStatus::Active, now);
        store.setActiveSessionCount(store.activeSessionCount() + 1);
        store.setMultiSessionEnabled(true);
        store.touch(now);
        *storeChanged = true;

        result.session = session;
        return Status::ok();
    });

    if (!result.status.isOk()) {
        result.session = Session();
    }
    return result;
}

SessionResult SessionManager::suspend(const QString &sessionId, const QString &note)
{
    SessionResult result = m_retry.run([&]() {
        return suspendOnce(sessionId, note);
    });

    if (!result.status.isOk()) {
        qWarning() << "SessionManager: suspend of" << sessionId << "failed:" << result.status.message();
        recordFailure(QStringLiteral("suspend"), sessionId, result.status);
        return result;
    }

    qDebug() << "SessionManager: Suspended" << sessionId;
    QJsonObject details;
    if (!note.isEmpty()) {
        details[QStringLiteral("note")] = note;
    }
    record(QStringLiteral("session_suspend"), sessionId, result.session.focus.currentTask, details, actorFor(result.session.agentId));

    Q_EMIT sessionSuspended(sessionId);
    return result;
}

SessionResult SessionManager::suspendOnce(const QString &sessionId, const QString &note)
{
    SessionResult result;
    const QDateTime now = QDateTime::currentDateTimeUtc();

    result.status = transact([&](SessionRegistry &registry, TaskStore &, bool *) -> Status {
        Session *session = registry.session(sessionId);
        if (!session) {
            return notFound(sessionId);
        }
        if (session->status != Session::Active) {
            return Status(ErrorCode::SessionWrongState, QStringLiteral("session %1 is %2, not active").arg(sessionId, Session::statusToString(session->status)));
        }

        session->status = Session::Suspended;
        session->suspendedAt = now;
        session->lastActivity = now;
        session->stats.suspendCount++;
        if (!note.isEmpty()) {
            session->focus.sessionNote = note;
        }
        registry.touch(now);

        // The focus task keeps its status while suspended
        result.session = *session;
        return Status::ok();
    });

    return result;
}

SessionResult SessionManager::resume(const QString &sessionId)
{
    SessionResult result = m_retry.run([&]() {
        return resumeOnce(sessionId);
    });

    if (!result.status.isOk()) {
        qWarning() << "SessionManager: resume of" << sessionId << "failed:" << result.status.message();
        recordFailure(QStringLiteral("resume"), sessionId, result.status);
        return result;
    }

    qDebug() << "SessionManager: Resumed" << sessionId;
    QJsonObject details;
    if (!result.warnings.isEmpty()) {
        details[QStringLiteral("warnings")] = toJsonArray(result.warnings);
    }
    record(QStringLiteral("session_resume"), sessionId, result.session.focus.currentTask, details, actorFor(result.session.agentId));

    Q_EMIT sessionResumed(sessionId);
    return result;
}

SessionResult SessionManager::resumeOnce(const QString &sessionId)
{
    SessionResult result;
    const QDateTime now = QDateTime::currentDateTimeUtc();

    result.status = transact([&](SessionRegistry &registry, TaskStore &store, bool *storeChanged) -> Status {
        Session *session = registry.session(sessionId);
        if (!session) {
            return notFound(sessionId);
        }
        if (session->status == Session::Active) {
            return Status(ErrorCode::SessionExists, QStringLiteral("session %1 is already active").arg(sessionId));
        }

        const QString focusId = session->focus.currentTask;
        if (!focusId.isEmpty()) {
            const Session *owner = registry.focusOwner(focusId, true, sessionId);
            if (owner) {
                return Status(ErrorCode::TaskClaimed, QStringLiteral("task %1 was claimed by session %2 while %3 was suspended").arg(focusId, owner->id, sessionId));
            }
        }

        session->status = Session::Active;
        session->suspendedAt = QDateTime();
        session->lastActivity = now;
        session->stats.resumeCount++;
        registry.touch(now);

        if (!focusId.isEmpty()) {
            const Task *task = store.task(focusId);
            if (!task) {
                result.warnings.append(QStringLiteral("focus task %1 no longer exists").arg(focusId));
            } else if (task->status == TaskStatus::Done) {
                result.warnings.append(QStringLiteral("focus task %1 was completed while suspended").arg(focusId));
            } else {
                store.setStatus(focusId, TaskStatus::Active, now);
                store.touch(now);
                *storeChanged = true;
            }
        }

        result.session = *session;
        return Status::ok();
    });

    return result;
}

SessionResult SessionManager::end(const QString &sessionId, const QString &note)
{
    SessionResult result = m_retry.run([&]() {
        return endOnce(sessionId, note);
    });

    if (!result.status.isOk()) {
        qWarning() << "SessionManager: end of" << sessionId << "failed:" << result.status.message();
        recordFailure(QStringLiteral("end"), sessionId, result.status);
        return result;
    }

    qDebug() << "SessionManager: Ended" << sessionId;
    QJsonObject details;
    details[QStringLiteral("stats")] = result.session.stats.toJson();
    if (!note.isEmpty()) {
        details[QStringLiteral("note")] = note;
    }
    record(QStringLiteral("session_end"), sessionId, result.session.focus.currentTask, details, actorFor(result.session.agentId));

    clearCurrentSessionId(sessionId);

    Q_EMIT sessionEnded(sessionId);
    return result;
}

SessionResult SessionManager::endOnce(const QString &sessionId, const QString &note)
{
    SessionResult result;
    const QDateTime now = QDateTime::currentDateTimeUtc();

    result.status = transact([&](SessionRegistry &registry, TaskStore &store, bool *storeChanged) -> Status {
        const Session *live = registry.session(sessionId);
        if (!live) {
            return notFound(sessionId);
        }
        const Session session = *live;

        if (!registry.endSession(sessionId, SessionHistoryEntry::fromSession(session, now, note))) {
            return notFound(sessionId);
        }
        registry.touch(now);

        const QString focusId = session.focus.currentTask;
        if (!focusId.isEmpty()) {
            const Task *task = store.task(focusId);
            if (task && task->status == TaskStatus::Active && !registry.focusOwner(focusId, true)) {
                store.setStatus(focusId, TaskStatus::Pending, now);
            }
        }
        // Counted at start, whether or not it still has a focus
        store.setActiveSessionCount(store.activeSessionCount() - 1);
        store.touch(now);
        *storeChanged = true;

        result.session = session;
        return Status::ok();
    });

    return result;
}

// ========== Focus ==========

SessionResult SessionManager::focus(const QString &sessionId, const QString &taskId)
{
    SessionResult result = m_retry.run([&]() {
        return focusOnce(sessionId, taskId);
    });

    if (!result.status.isOk()) {
        qWarning() << "SessionManager: focus of" << sessionId << "on" << taskId << "failed:" << result.status.message();
        recordFailure(QStringLiteral("focus"), sessionId, result.status);
        return result;
    }

    QJsonObject details;
    details[QStringLiteral("previousTask")] = result.session.focus.previousTask;
    record(QStringLiteral("focus_changed"), sessionId, taskId, details, actorFor(result.session.agentId));

    Q_EMIT focusChanged(sessionId, taskId);
    return result;
}

SessionResult SessionManager::focusOnce(const QString &sessionId, const QString &taskId)
{
    SessionResult result;
    const QDateTime now = QDateTime::currentDateTimeUtc();

    result.status = transact([&](SessionRegistry &registry, TaskStore &store, bool *storeChanged) -> Status {
        Session *session = registry.session(sessionId);
        if (!session) {
            return notFound(sessionId);
        }
        if (session->status != Session::Active) {
            return Status(ErrorCode::SessionWrongState, QStringLiteral("session %1 is suspended").arg(sessionId));
        }
        if (!session->inScope(taskId)) {
            return Status(ErrorCode::FocusNotInScope, QStringLiteral("task %1 is not in the scope of session %2").arg(taskId, sessionId));
        }

        const Task *task = store.task(taskId);
        if (!task) {
            return Status(ErrorCode::TaskNotFound, QStringLiteral("task %1 not found").arg(taskId));
        }
        if (task->status == TaskStatus::Done) {
            return Status(ErrorCode::InvalidArgument, QStringLiteral("task %1 is already done").arg(taskId));
        }

        const Session *owner = registry.focusOwner(taskId, true, sessionId);
        if (owner) {
            return Status(ErrorCode::TaskClaimed, QStringLiteral("task %1 is already the focus of session %2").arg(taskId, owner->id));
        }

        const QString previous = session->focus.currentTask;
        if (!previous.isEmpty() && previous != taskId) {
            const Task *old = store.task(previous);
            if (old && old->status == TaskStatus::Active && !registry.focusOwner(previous, true, sessionId)) {
                store.setStatus(previous, TaskStatus::Pending, now);
            }
        }

        if (previous != taskId) {
            // After a completion the last focus is already recorded as previous
            if (!previous.isEmpty()) {
                session->focus.previousTask = previous;
            }
            session->focus.currentTask = taskId;
            session->focus.focusHistory.append(FocusEvent{taskId, now, QStringLiteral("focused")});
            session->stats.focusChanges++;
        }
        session->lastActivity = now;
        registry.touch(now);

        store.setStatus(taskId, TaskStatus::Active, now);
        store.touch(now);
        *storeChanged = true;

        result.session = *session;
        return Status::ok();
    });

    return result;
}

SessionResult SessionManager::complete(const QString &sessionId, const QString &taskId)
{
    SessionResult result = m_retry.run([&]() {
        return completeOnce(sessionId, taskId);
    });

    if (!result.status.isOk()) {
        qWarning() << "SessionManager: complete of" << taskId << "failed:" << result.status.message();
        recordFailure(QStringLiteral("complete"), sessionId, result.status);
        return result;
    }

    QJsonObject details;
    details[QStringLiteral("status")] = Task::statusToString(TaskStatus::Done);
    record(QStringLiteral("status_changed"), sessionId, taskId, details, actorFor(result.session.agentId));

    Q_EMIT taskCompleted(sessionId, taskId);
    return result;
}

SessionResult SessionManager::completeOnce(const QString &sessionId, const QString &taskId)
{
    SessionResult result;
    const QDateTime now = QDateTime::currentDateTimeUtc();

    result.status = transact([&](SessionRegistry &registry, TaskStore &store, bool *storeChanged) -> Status {
        Session *session = registry.session(sessionId);
        if (!session) {
            return notFound(sessionId);
        }
        if (session->status != Session::Active) {
            return Status(ErrorCode::SessionWrongState, QStringLiteral("session %1 is suspended").arg(sessionId));
        }
        if (!session->inScope(taskId)) {
            return Status(ErrorCode::FocusNotInScope, QStringLiteral("task %1 is not in the scope of session %2").arg(taskId, sessionId));
        }

        const Task *task = store.task(taskId);
        if (!task) {
            return Status(ErrorCode::TaskNotFound, QStringLiteral("task %1 not found").arg(taskId));
        }
        if (task->status == TaskStatus::Done) {
            return Status(ErrorCode::InvalidArgument, QStringLiteral("task %1 is already done").arg(taskId));
        }

        const Session *owner = registry.focusOwner(taskId, false, sessionId);
        if (owner) {
            return Status(ErrorCode::TaskClaimed, QStringLiteral("task %1 is the focus of session %2").arg(taskId, owner->id));
        }

        store.setStatus(taskId, TaskStatus::Done, now);
        store.touch(now);
        *storeChanged = true;

        session->stats.tasksCompleted++;
        if (session->focus.currentTask == taskId) {
            session->focus.previousTask = taskId;
            session->focus.currentTask.clear();
            session->focus.focusHistory.append(FocusEvent{taskId, now, QStringLiteral("completed")});
        }
        session->lastActivity = now;
        registry.touch(now);

        result.session = *session;
        return Status::ok();
    });

    return result;
}

// ========== Tasks ==========

TaskResult SessionManager::addTask(const Task &task)
{
    TaskResult result = m_retry.run([&]() {
        return addTaskOnce(task);
    });

    if (!result.status.isOk()) {
        qWarning() << "SessionManager: Adding task failed:" << result.status.message();
        recordFailure(QStringLiteral("add"), QString(), result.status);
        return result;
    }

    QJsonObject details;
    details[QStringLiteral("title")] = result.task.title;
    details[QStringLiteral("parentId")] = result.task.parentId;
    record(QStringLiteral("task_created"), QString(), result.task.id, details, QStringLiteral("human"));
    return result;
}

TaskResult SessionManager::addTaskOnce(const Task &task)
{
    TaskResult result;

    if (task.title.trimmed().isEmpty()) {
        result.status = Status(ErrorCode::InvalidArgument, QStringLiteral("task needs a title"));
        return result;
    }
    if (!Task::isKnownPriority(task.priority)) {
        result.status = Status(ErrorCode::InvalidArgument, QStringLiteral("unknown priority \"%1\"").arg(task.priority));
        return result;
    }
    if (!m_storeRepo->exists()) {
        result.status = Status(ErrorCode::FileNotFound, QStringLiteral("no task store in %1, run init first").arg(dataDir()));
        return result;
    }

    // Single-document operation: only the store lock is needed
    FileLock lock(taskStorePath());
    lock.setStaleLockTime(m_staleLockMs);
    result.status = lock.acquire(m_lockTimeoutMs);
    if (!result.status.isOk()) {
        return result;
    }

    TaskStore store;
    result.status = loadStore(&store);
    if (!result.status.isOk()) {
        return result;
    }
    const QString loadedChecksum = store.storedChecksum();

    result.status = HierarchyPolicy::canAddChild(task.parentId, store, m_hierarchy);
    if (!result.status.isOk()) {
        return result;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    Task created = task;
    if (created.id.isEmpty()) {
        created.id = store.nextTaskId();
    }
    if (!created.createdAt.isValid()) {
        created.createdAt = now;
    }
    created.updatedAt = now;

    result.status = store.appendTask(created);
    if (!result.status.isOk()) {
        return result;
    }
    store.touch(now);

    QString onDisk;
    result.status = m_storeRepo->diskChecksum(&onDisk);
    if (!result.status.isOk()) {
        return result;
    }
    if (onDisk != loadedChecksum) {
        result.status = Status(ErrorCode::ChecksumMismatch, QStringLiteral("task store was modified by another writer"));
        return result;
    }

    result.status = m_storeRepo->write(store.toJson());
    if (!result.status.isOk()) {
        return result;
    }

    qDebug() << "SessionManager: Added task" << created.id;
    result.task = created;
    return result;
}

// ========== Queries ==========

Status SessionManager::listSessions(SessionFilter filter, QList<Session> *sessions)
{
    SessionRegistry registry;
    const Status status = m_retry.run([&]() {
        return readRegistryLocked(&registry);
    });
    if (!status.isOk()) {
        return status;
    }

    switch (filter) {
    case AllSessions:
        *sessions = registry.sessions();
        break;
    case ActiveSessions:
        *sessions = registry.activeSessions();
        break;
    case SuspendedSessions:
        *sessions = registry.suspendedSessions();
        break;
    }
    return Status::ok();
}

Status SessionManager::session(const QString &sessionId, Session *session)
{
    SessionRegistry registry;
    const Status status = m_retry.run([&]() {
        return readRegistryLocked(&registry);
    });
    if (!status.isOk()) {
        return status;
    }

    const Session *found = registry.session(sessionId);
    if (!found) {
        return notFound(sessionId);
    }
    *session = *found;
    return Status::ok();
}

Status SessionManager::history(QList<SessionHistoryEntry> *entries)
{
    SessionRegistry registry;
    const Status status = m_retry.run([&]() {
        return readRegistryLocked(&registry);
    });
    if (!status.isOk()) {
        return status;
    }

    *entries = registry.history();
    return Status::ok();
}

Status SessionManager::loadTaskStore(TaskStore *store)
{
    if (!m_storeRepo->exists()) {
        return Status(ErrorCode::FileNotFound, QStringLiteral("no task store in %1, run init first").arg(dataDir()));
    }

    return m_retry.run([&]() {
        FileLock lock(taskStorePath());
        lock.setStaleLockTime(m_staleLockMs);
        const Status locked = lock.acquire(m_lockTimeoutMs);
        if (!locked.isOk()) {
            return locked;
        }
        return loadStore(store);
    });
}

// ========== Backups ==========

Status SessionManager::restoreBackup(const QString &documentPath, int number)
{
    const QString path = QFileInfo(documentPath).absoluteFilePath();

    const DocumentValidator *validator = nullptr;
    if (path == taskStorePath()) {
        validator = &m_storeValidator;
    } else if (path == sessionRegistryPath()) {
        validator = &m_registryValidator;
    } else {
        return Status(ErrorCode::InvalidArgument, QStringLiteral("%1 is not a document of this project").arg(documentPath));
    }

    QString backupPath;
    const Status status = m_retry.run([&]() {
        FileLock lock(path);
        lock.setStaleLockTime(m_staleLockMs);
        Status result = lock.acquire(m_lockTimeoutMs);
        if (!result.isOk()) {
            return result;
        }

        QByteArray content;
        result = m_backups.readBackup(path, number, &content, &backupPath);
        if (!result.isOk()) {
            return result;
        }

        result = m_writer->write(path, content, *validator);
        if (!result.isOk()) {
            return Status(ErrorCode::RestoreFailed, result.message());
        }
        return result;
    });

    if (!status.isOk()) {
        qWarning() << "SessionManager: Restore of" << path << "failed:" << status.message();
        recordFailure(QStringLiteral("restore"), QString(), status);
        return status;
    }

    qDebug() << "SessionManager: Restored" << path << "from" << backupPath;
    QJsonObject details;
    details[QStringLiteral("file")] = QFileInfo(path).fileName();
    details[QStringLiteral("backup")] = backupPath;
    record(QStringLiteral("backup_restored"), QString(), QString(), details, QStringLiteral("human"));
    return status;
}

// ========== Current session ==========

QString SessionManager::currentSessionId() const
{
    const QString fromEnv = qEnvironmentVariable("TASKSCOPE_SESSION").trimmed();
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }

    QFile file(dataDir() + QStringLiteral("/.current-session"));
    if (!file.open(QIODevice::ReadOnly)) {
        return QString();
    }
    return QString::fromUtf8(file.readAll()).trimmed();
}

Status SessionManager::setCurrentSessionId(const QString &sessionId)
{
    QSaveFile file(dataDir() + QStringLiteral("/.current-session"));
    if (!file.open(QIODevice::WriteOnly)) {
        return Status(ErrorCode::WriteFailed, QStringLiteral("cannot write current session: %1").arg(file.errorString()));
    }
    const QByteArray data = sessionId.toUtf8() + '\n';
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        return Status(ErrorCode::WriteFailed, QStringLiteral("short write to current session file"));
    }
    if (!file.commit()) {
        return Status(ErrorCode::WriteFailed, QStringLiteral("cannot write current session: %1").arg(file.errorString()));
    }
    return Status::ok();
}

void SessionManager::clearCurrentSessionId(const QString &sessionId)
{
    const QString path = dataDir() + QStringLiteral("/.current-session");
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return;
    }
    const QString stored = QString::fromUtf8(file.readAll()).trimmed();
    file.close();

    if (stored == sessionId && !QFile::remove(path)) {
        qWarning() << "SessionManager: Could not remove" << path;
    }
}

} // namespace Taskscope

#include "moc_SessionManager.cpp"

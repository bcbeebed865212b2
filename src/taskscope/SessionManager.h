/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_SESSIONMANAGER_H
#define TASKSCOPE_SESSIONMANAGER_H

#include "taskscope_export.h"

#include "AuditLog.h"
#include "BackupManager.h"
#include "ConflictDetector.h"
#include "DocumentValidator.h"
#include "HierarchyPolicy.h"
#include "RetryPolicy.h"
#include "Session.h"
#include "SessionRegistry.h"
#include "Status.h"
#include "Task.h"
#include "TaskStore.h"

#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>

namespace Taskscope
{

class AtomicWriter;
class DocumentRepository;
class TaskscopeSettings;

struct TASKSCOPE_EXPORT StartRequest {
    ScopeDeclaration scope;
    QString focusTaskId; // empty = pick automatically
    QString name;
    QString agentId;
};

/**
 * Outcome of a lifecycle or focus operation.
 */
struct TASKSCOPE_EXPORT SessionResult {
    Status status;
    Session session; // state after the operation (before removal, for end)
    QList<ConflictReport> conflicts; // every overlap seen by start, permitted or not
    QStringList warnings;
};

struct TASKSCOPE_EXPORT TaskResult {
    Status status;
    Task task;
};

/**
 * SessionManager drives the session lifecycle for one project directory.
 *
 * Project layout:
 *   <project>/.taskscope/todo.json         task store
 *   <project>/.taskscope/sessions.json     session registry
 *   <project>/.taskscope/audit-log.jsonl   audit trail
 *   <project>/.taskscope/.backups/         numbered backups of both documents
 *
 * Every mutating operation:
 * 1. locks the session registry, then the task store;
 * 2. loads both documents into typed snapshots;
 * 3. checks all preconditions and computes the new state in memory;
 * 4. validates both serialized documents, then writes the registry and the
 *    store through AtomicWriter;
 * 5. releases the locks in reverse order.
 *
 * A rejected operation leaves both documents untouched. Recoverable
 * failures (lock timeout, checksum mismatch, id collision) rerun the whole
 * operation under the configured RetryPolicy.
 */
class TASKSCOPE_EXPORT SessionManager : public QObject
{
    Q_OBJECT

public:
    enum SessionFilter {
        AllSessions,
        ActiveSessions,
        SuspendedSessions
    };

    explicit SessionManager(const QString &projectDir, TaskscopeSettings *settings = nullptr, QObject *parent = nullptr);
    ~SessionManager() override;

    static QString dataDirFor(const QString &projectDir);

    QString projectDir() const
    {
        return m_projectDir;
    }

    QString dataDir() const;
    QString taskStorePath() const;
    QString sessionRegistryPath() const;
    QString auditLogPath() const;

    void setRetryPolicy(const RetryPolicy &policy)
    {
        m_retry = policy;
    }

    RetryPolicy retryPolicy() const
    {
        return m_retry;
    }

    void setLockTimeout(int ms)
    {
        m_lockTimeoutMs = ms;
    }

    int lockTimeout() const
    {
        return m_lockTimeoutMs;
    }

    void setHierarchyLimits(const HierarchyLimits &limits)
    {
        m_hierarchy = limits;
    }

    HierarchyLimits hierarchyLimits() const
    {
        return m_hierarchy;
    }

    /**
     * Replace the writer used for both documents. Takes ownership.
     */
    void setAtomicWriter(std::unique_ptr<AtomicWriter> writer);

    BackupManager *backupManager()
    {
        return &m_backups;
    }

    AuditLog *auditLog()
    {
        return &m_audit;
    }

    bool isInitialized() const;

    /**
     * Create whichever of the two documents is missing. Existing documents
     * are left alone.
     */
    Status init(const QString &projectName = QString());

    SessionResult start(const StartRequest &request);
    SessionResult suspend(const QString &sessionId, const QString &note = QString());
    SessionResult resume(const QString &sessionId);
    SessionResult end(const QString &sessionId, const QString &note = QString());

    /**
     * Move an active session's focus to another task in its scope.
     */
    SessionResult focus(const QString &sessionId, const QString &taskId);

    /**
     * Mark an in-scope task done on behalf of an active session.
     */
    SessionResult complete(const QString &sessionId, const QString &taskId);

    /**
     * Append a task, subject to the hierarchy limits. An empty id is
     * replaced by the next free T### id.
     */
    TaskResult addTask(const Task &task);

    Status listSessions(SessionFilter filter, QList<Session> *sessions);
    Status session(const QString &sessionId, Session *session);
    Status history(QList<SessionHistoryEntry> *entries);
    Status loadTaskStore(TaskStore *store);

    /**
     * Replace @p documentPath (one of the two documents) with backup
     * @p number, or the latest backup when @p number <= 0.
     */
    Status restoreBackup(const QString &documentPath, int number = 0);

    /**
     * TASKSCOPE_SESSION from the environment, else the id stored in
     * .taskscope/.current-session.
     */
    QString currentSessionId() const;
    Status setCurrentSessionId(const QString &sessionId);

    /**
     * Forget the stored current session if it is @p sessionId.
     */
    void clearCurrentSessionId(const QString &sessionId);

    /**
     * Highest-priority pending task among @p candidateIds, oldest first on
     * ties. Empty when nothing is pending.
     */
    static QString autoSelectFocus(const TaskStore &store, const QStringList &candidateIds);

Q_SIGNALS:
    void sessionStarted(const QString &sessionId, const QString &focusTaskId);
    void sessionSuspended(const QString &sessionId);
    void sessionResumed(const QString &sessionId);
    void sessionEnded(const QString &sessionId);
    void focusChanged(const QString &sessionId, const QString &taskId);
    void taskCompleted(const QString &sessionId, const QString &taskId);

private:
    using Mutation = std::function<Status(SessionRegistry &registry, TaskStore &store, bool *storeChanged)>;

    /**
     * Lock both documents in order, load them, run @p mutate and commit
     * whatever it changed.
     */
    Status transact(const Mutation &mutate);
    Status commit(const SessionRegistry &registry, const TaskStore &store, bool storeChanged, const QString &registryChecksum, const QString &storeChecksum);
    Status loadRegistry(SessionRegistry *registry) const;
    Status loadStore(TaskStore *store) const;
    Status readRegistryLocked(SessionRegistry *registry);

    SessionResult startOnce(const StartRequest &request);
    SessionResult suspendOnce(const QString &sessionId, const QString &note);
    SessionResult resumeOnce(const QString &sessionId);
    SessionResult endOnce(const QString &sessionId, const QString &note);
    SessionResult focusOnce(const QString &sessionId, const QString &taskId);
    SessionResult completeOnce(const QString &sessionId, const QString &taskId);
    TaskResult addTaskOnce(const Task &task);

    void rebuildRepositories();
    void record(const QString &action, const QString &sessionId, const QString &taskId, const QJsonObject &details, const QString &actor);
    void recordFailure(const QString &operation, const QString &sessionId, const Status &status);
    static QString actorFor(const QString &agentId);

    QString m_projectDir;
    RetryPolicy m_retry;
    int m_lockTimeoutMs = 30000;
    int m_staleLockMs = 0;
    HierarchyLimits m_hierarchy;
    RegistryConfig m_registryDefaults;

    BackupManager m_backups;
    AuditLog m_audit;
    TaskStoreValidator m_storeValidator;
    SessionRegistryValidator m_registryValidator;
    std::unique_ptr<AtomicWriter> m_writer;
    std::unique_ptr<DocumentRepository> m_storeRepo;
    std::unique_ptr<DocumentRepository> m_registryRepo;
};

} // namespace Taskscope

#endif // TASKSCOPE_SESSIONMANAGER_H

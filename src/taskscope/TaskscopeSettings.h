/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_SETTINGS_H
#define TASKSCOPE_SETTINGS_H

#include "taskscope_export.h"

#include "RetryPolicy.h"
#include "SessionRegistry.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace Taskscope
{

/**
 * Process-level tunables and the defaults written into a new project.
 *
 * Read from taskscoperc. Per-project session policy is stored in the
 * registry's config object; the values here only seed it at init time.
 */
class TASKSCOPE_EXPORT TaskscopeSettings : public QObject
{
    Q_OBJECT

public:
    static TaskscopeSettings *instance();

    explicit TaskscopeSettings(QObject *parent = nullptr);
    /**
     * Use a specific config object, e.g. KSharedConfig::openConfig(path, KConfig::SimpleConfig).
     */
    explicit TaskscopeSettings(KSharedConfig::Ptr config, QObject *parent = nullptr);
    ~TaskscopeSettings() override;

    // ========== Locking ==========

    /**
     * Maximum wait for a document lock in milliseconds (default: 30000)
     */
    int lockTimeoutMs() const;
    void setLockTimeoutMs(int ms);

    /**
     * Age after which a lock held by a live process is stolen (0 = never)
     */
    int staleLockMs() const;
    void setStaleLockMs(int ms);

    // ========== Backups ==========

    int maxBackups() const;
    void setMaxBackups(int count);

    QString backupDirName() const;
    void setBackupDirName(const QString &name);

    // ========== Retry ==========

    RetryPolicy retryPolicy() const;
    void setRetryPolicy(const RetryPolicy &policy);

    // ========== Session defaults ==========

    /**
     * Config written into a freshly initialised session registry
     */
    RegistryConfig registryDefaults() const;
    void setRegistryDefaults(const RegistryConfig &config);

    /**
     * maxDepth used for scopes that do not declare one (default: 10)
     */
    int defaultScopeDepth() const;
    void setDefaultScopeDepth(int depth);

    // ========== Hierarchy ==========

    int hierarchyMaxDepth() const;
    void setHierarchyMaxDepth(int depth);

    /**
     * 0 = unlimited
     */
    int hierarchyMaxSiblings() const;
    void setHierarchyMaxSiblings(int count);

    bool countDoneInSiblingLimit() const;
    void setCountDoneInSiblingLimit(bool enabled);

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    static TaskscopeSettings *s_instance;

    KSharedConfig::Ptr m_config;
};

} // namespace Taskscope

#endif // TASKSCOPE_SETTINGS_H

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TaskscopeSettings.h"

#include <KConfigGroup>

#include <QDebug>

namespace Taskscope
{

TaskscopeSettings *TaskscopeSettings::s_instance = nullptr;

TaskscopeSettings *TaskscopeSettings::instance()
{
    return s_instance;
}

TaskscopeSettings::TaskscopeSettings(QObject *parent)
    : TaskscopeSettings(KSharedConfig::openConfig(QStringLiteral("taskscoperc")), parent)
{
}

TaskscopeSettings::TaskscopeSettings(KSharedConfig::Ptr config, QObject *parent)
    : QObject(parent)
    , m_config(config)
{
    if (!s_instance) {
        s_instance = this;
    }
}

TaskscopeSettings::~TaskscopeSettings()
{
    save();
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

int TaskscopeSettings::lockTimeoutMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Locking"));
    return group.readEntry("LockTimeoutMs", 30000);
}

void TaskscopeSettings::setLockTimeoutMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Locking"));
    group.writeEntry("LockTimeoutMs", ms);
    Q_EMIT settingsChanged();
}

int TaskscopeSettings::staleLockMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Locking"));
    return group.readEntry("StaleLockMs", 0);
}

void TaskscopeSettings::setStaleLockMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Locking"));
    group.writeEntry("StaleLockMs", ms);
    Q_EMIT settingsChanged();
}

int TaskscopeSettings::maxBackups() const
{
    KConfigGroup group(m_config, QStringLiteral("Backups"));
    return group.readEntry("MaxBackups", 10);
}

void TaskscopeSettings::setMaxBackups(int count)
{
    KConfigGroup group(m_config, QStringLiteral("Backups"));
    group.writeEntry("MaxBackups", count);
    Q_EMIT settingsChanged();
}

QString TaskscopeSettings::backupDirName() const
{
    KConfigGroup group(m_config, QStringLiteral("Backups"));
    return group.readEntry("BackupDirName", QStringLiteral(".backups"));
}

void TaskscopeSettings::setBackupDirName(const QString &name)
{
    KConfigGroup group(m_config, QStringLiteral("Backups"));
    group.writeEntry("BackupDirName", name);
    Q_EMIT settingsChanged();
}

RetryPolicy TaskscopeSettings::retryPolicy() const
{
    KConfigGroup group(m_config, QStringLiteral("Retry"));
    RetryPolicy policy;
    policy.maxAttempts = qMax(1, group.readEntry("MaxAttempts", policy.maxAttempts));
    policy.initialDelayMs = group.readEntry("InitialDelayMs", policy.initialDelayMs);
    policy.multiplier = group.readEntry("Multiplier", policy.multiplier);
    policy.maxTotalMs = group.readEntry("MaxTotalMs", policy.maxTotalMs);
    return policy;
}

void TaskscopeSettings::setRetryPolicy(const RetryPolicy &policy)
{
    KConfigGroup group(m_config, QStringLiteral("Retry"));
    group.writeEntry("MaxAttempts", policy.maxAttempts);
    group.writeEntry("InitialDelayMs", policy.initialDelayMs);
    group.writeEntry("Multiplier", policy.multiplier);
    group.writeEntry("MaxTotalMs", policy.maxTotalMs);
    Q_EMIT settingsChanged();
}

RegistryConfig TaskscopeSettings::registryDefaults() const
{
    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    RegistryConfig config;
    config.maxConcurrentSessions = group.readEntry("MaxConcurrentSessions", config.maxConcurrentSessions);
    config.maxActiveTasksPerScope = group.readEntry("MaxActiveTasksPerScope", config.maxActiveTasksPerScope);
    config.allowNestedScopes = group.readEntry("AllowNestedScopes", config.allowNestedScopes);
    config.allowScopeOverlap = group.readEntry("AllowScopeOverlap", config.allowScopeOverlap);
    return config;
}

void TaskscopeSettings::setRegistryDefaults(const RegistryConfig &config)
{
    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    group.writeEntry("MaxConcurrentSessions", config.maxConcurrentSessions);
    group.writeEntry("MaxActiveTasksPerScope", config.maxActiveTasksPerScope);
    group.writeEntry("AllowNestedScopes", config.allowNestedScopes);
    group.writeEntry("AllowScopeOverlap", config.allowScopeOverlap);
    Q_EMIT settingsChanged();
}

int TaskscopeSettings::defaultScopeDepth() const
{
    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    return group.readEntry("DefaultMaxDepth", static_cast<int>(ScopeDeclaration::DefaultMaxDepth));
}

void TaskscopeSettings::setDefaultScopeDepth(int depth)
{
    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    group.writeEntry("DefaultMaxDepth", depth);
    Q_EMIT settingsChanged();
}

int TaskscopeSettings::hierarchyMaxDepth() const
{
    KConfigGroup group(m_config, QStringLiteral("Hierarchy"));
    return group.readEntry("MaxDepth", 3);
}

void TaskscopeSettings::setHierarchyMaxDepth(int depth)
{
    KConfigGroup group(m_config, QStringLiteral("Hierarchy"));
    group.writeEntry("MaxDepth", depth);
    Q_EMIT settingsChanged();
}

int TaskscopeSettings::hierarchyMaxSiblings() const
{
    KConfigGroup group(m_config, QStringLiteral("Hierarchy"));
    return group.readEntry("MaxSiblings", 20);
}

void TaskscopeSettings::setHierarchyMaxSiblings(int count)
{
    KConfigGroup group(m_config, QStringLiteral("Hierarchy"));
    group.writeEntry("MaxSiblings", count);
    Q_EMIT settingsChanged();
}

bool TaskscopeSettings::countDoneInSiblingLimit() const
{
    KConfigGroup group(m_config, QStringLiteral("Hierarchy"));
    return group.readEntry("CountDoneInLimit", false);
}

void TaskscopeSettings::setCountDoneInSiblingLimit(bool enabled)
{
    KConfigGroup group(m_config, QStringLiteral("Hierarchy"));
    group.writeEntry("CountDoneInLimit", enabled);
    Q_EMIT settingsChanged();
}

void TaskscopeSettings::save()
{
    if (!m_config->sync()) {
        qWarning() << "TaskscopeSettings: Failed to write" << m_config->name();
    }
}

} // namespace Taskscope

#include "moc_TaskscopeSettings.cpp"

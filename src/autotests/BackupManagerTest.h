/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef BACKUPMANAGERTEST_H
#define BACKUPMANAGERTEST_H

#include <QObject>

namespace Taskscope
{

class BackupManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testNumbering();
    void testRotationDropsOldest();
    void testMissingSource();
    void testReadLatestAndNumbered();
    void testRejectsEmptyOrCorruptBackup();
    void testIgnoresUnrelatedFiles();
    void testEmitsAuditEvent();
};

} // namespace Taskscope

#endif // BACKUPMANAGERTEST_H

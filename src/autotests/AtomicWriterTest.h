/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ATOMICWRITERTEST_H
#define ATOMICWRITERTEST_H

#include <QObject>

namespace Taskscope
{

class AtomicWriterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testWriteNewFile();
    void testReplaceKeepsBackup();
    void testRejectsEmptyContent();
    void testRejectsMalformedJson();
    void testRejectsInvalidDocument();
    void testFailedSwapRestoresPreviousContent();
    void testBackupFailureLeavesTargetUntouched();
};

} // namespace Taskscope

#endif // ATOMICWRITERTEST_H

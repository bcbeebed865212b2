/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RETRYPOLICYTEST_H
#define RETRYPOLICYTEST_H

#include <QObject>

namespace Taskscope
{

class RetryPolicyTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testDelayGrowsExponentially();
    void testDelayCappedByTotalTime();
    void testRetriesRecoverableFailures();
    void testStopsOnPolicyFailure();
    void testGivesUpAfterMaxAttempts();
    void testWallTimeCapStopsRetrying();
    void testRetriesResultStructs();

    // Status
    void testRecoverableCategories();
    void testStableExitCodes();
    void testCategoryNames();
};

} // namespace Taskscope

#endif // RETRYPOLICYTEST_H

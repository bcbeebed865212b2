/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SCOPERESOLVERTEST_H
#define SCOPERESOLVERTEST_H

#include <QObject>

namespace Taskscope
{

class ScopeResolverTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testTaskScope();
    void testTaskGroupScope();
    void testSubtreeScope();
    void testSubtreeDepthLimit();
    void testEpicScope();
    void testEpicPhaseScope();
    void testEpicPhaseNeedsFilter();
    void testCustomScope();
    void testCustomScopeUnknownTask();
    void testExclusions();
    void testLeafSubtree();
    void testMissingRoot();
    void testEverythingExcluded();
    void testCycleTerminates();
    void testDeterministic();
};

} // namespace Taskscope

#endif // SCOPERESOLVERTEST_H

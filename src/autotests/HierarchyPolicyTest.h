/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HIERARCHYPOLICYTEST_H
#define HIERARCHYPOLICYTEST_H

#include <QObject>

namespace Taskscope
{

class HierarchyPolicyTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testTopLevelAlwaysAllowed();
    void testMissingParent();
    void testDepthLimit();
    void testSiblingLimit();
    void testSiblingLimitCountsDoneWhenConfigured();
    void testUnlimitedSiblings();
    void testCyclicParentChain();
};

} // namespace Taskscope

#endif // HIERARCHYPOLICYTEST_H

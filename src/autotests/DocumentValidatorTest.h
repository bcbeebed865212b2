/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef DOCUMENTVALIDATORTEST_H
#define DOCUMENTVALIDATORTEST_H

#include <QObject>

namespace Taskscope
{

class DocumentValidatorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testSyntax();
    void testValidTaskStore();
    void testTaskStoreErrors();
    void testValidSessionRegistry();
    void testSessionRegistryErrors();
};

} // namespace Taskscope

#endif // DOCUMENTVALIDATORTEST_H

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_SCOPERESOLVER_H
#define TASKSCOPE_SCOPERESOLVER_H

#include "taskscope_export.h"

#include "Session.h"
#include "Status.h"

#include <QHash>
#include <QStringList>

namespace Taskscope
{

class TaskStore;

struct TASKSCOPE_EXPORT ResolvedScope {
    Status status;
    QStringList taskIds; // breadth-first from the root, custom scopes keep caller order
};

/**
 * Turns a scope declaration into the concrete set of task ids it covers.
 *
 * Pure: the result depends only on the snapshot and the declaration.
 */
class TASKSCOPE_EXPORT ScopeResolver
{
public:
    /**
     * ScopeInvalid when the root (or a custom id) does not exist, an
     * epicPhase scope has no phase filter, or nothing is left after
     * exclusions.
     */
    static ResolvedScope resolve(const TaskStore &store, const ScopeDeclaration &scope);

    /**
     * @p rootId and its descendants down to @p maxDepth levels (0 = the root
     * alone). Revisits are skipped, so a corrupted parent cycle terminates.
     */
    static QStringList descendants(const QString &rootId, const QHash<QString, QStringList> &children, int maxDepth);

private:
    ScopeResolver() = default;
};

} // namespace Taskscope

#endif // TASKSCOPE_SCOPERESOLVER_H

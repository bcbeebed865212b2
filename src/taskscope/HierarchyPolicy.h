/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_HIERARCHYPOLICY_H
#define TASKSCOPE_HIERARCHYPOLICY_H

#include "taskscope_export.h"

#include "Status.h"

#include <QString>

namespace Taskscope
{

class TaskStore;

struct TASKSCOPE_EXPORT HierarchyLimits {
    int maxDepth = 3; // top-level tasks are depth 0
    int maxSiblings = 20; // 0 = unlimited
    bool countDoneInLimit = false;
};

/**
 * Depth and fan-out rules for the task tree.
 */
class TASKSCOPE_EXPORT HierarchyPolicy
{
public:
    /**
     * Whether a new child may be attached under @p parentId.
     * An empty parent is always allowed (new top-level task).
     * Returns ParentNotFound, DepthExceeded (also for a cyclic parent chain)
     * or SiblingLimit.
     */
    static Status canAddChild(const QString &parentId, const TaskStore &store, const HierarchyLimits &limits);

    /**
     * Number of ancestors of @p taskId, or -1 if the parent chain loops or
     * references a missing task.
     */
    static int depthOf(const QString &taskId, const TaskStore &store);

    /**
     * Children of @p parentId counted against the sibling limit.
     */
    static int siblingCount(const QString &parentId, const TaskStore &store, bool countDone);

private:
    HierarchyPolicy() = default;
};

} // namespace Taskscope

#endif // TASKSCOPE_HIERARCHYPOLICY_H

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_DOCUMENTVALIDATOR_H
#define TASKSCOPE_DOCUMENTVALIDATOR_H

#include "taskscope_export.h"

#include <QJsonDocument>
#include <QStringList>

namespace Taskscope
{

struct TASKSCOPE_EXPORT ValidationResult {
    QStringList errors;

    bool isValid() const
    {
        return errors.isEmpty();
    }
};

/**
 * Checks a candidate document body before it is allowed to replace the file
 * on disk. AtomicWriter runs it on the staged content; DocumentRepository
 * also runs it on load.
 */
class TASKSCOPE_EXPORT DocumentValidator
{
public:
    virtual ~DocumentValidator() = default;

    virtual ValidationResult validate(const QJsonDocument &doc) const = 0;
};

/**
 * Accepts any non-empty JSON object.
 */
class TASKSCOPE_EXPORT JsonSyntaxValidator : public DocumentValidator
{
public:
    ValidationResult validate(const QJsonDocument &doc) const override;
};

/**
 * tasks array present; ids non-empty and unique; status and priority known;
 * every parentId names an existing task.
 */
class TASKSCOPE_EXPORT TaskStoreValidator : public DocumentValidator
{
public:
    ValidationResult validate(const QJsonDocument &doc) const override;
};

/**
 * sessions and sessionHistory arrays present; live session ids unique;
 * status known; every live session has a non-empty computed scope.
 */
class TASKSCOPE_EXPORT SessionRegistryValidator : public DocumentValidator
{
public:
    ValidationResult validate(const QJsonDocument &doc) const override;
};

} // namespace Taskscope

#endif // TASKSCOPE_DOCUMENTVALIDATOR_H

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "DocumentValidator.h"
#include "Session.h"
#include "Task.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QPair>
#include <QSet>

#include <utility>

namespace Taskscope
{

ValidationResult JsonSyntaxValidator::validate(const QJsonDocument &doc) const
{
    ValidationResult result;
    if (doc.isNull() || !doc.isObject()) {
        result.errors.append(QStringLiteral("document is not a JSON object"));
    } else if (doc.object().isEmpty()) {
        result.errors.append(QStringLiteral("document is empty"));
    }
    return result;
}

ValidationResult TaskStoreValidator::validate(const QJsonDocument &doc) const
{
    ValidationResult result = JsonSyntaxValidator().validate(doc);
    if (!result.isValid()) {
        return result;
    }

    const QJsonValue tasksValue = doc.object().value(QStringLiteral("tasks"));
    if (!tasksValue.isArray()) {
        result.errors.append(QStringLiteral("missing \"tasks\" array"));
        return result;
    }

    const QJsonArray tasks = tasksValue.toArray();
    QSet<QString> ids;
    QList<QPair<QString, QString>> parentEdges;
    for (const QJsonValue &value : tasks) {
        if (!value.isObject()) {
            result.errors.append(QStringLiteral("task entry is not an object"));
            continue;
        }
        const QJsonObject obj = value.toObject();
        const QString id = obj.value(QStringLiteral("id")).toString();
        if (id.isEmpty()) {
            result.errors.append(QStringLiteral("task without id"));
            continue;
        }
        if (ids.contains(id)) {
            result.errors.append(QStringLiteral("duplicate task id %1").arg(id));
        }
        ids.insert(id);

        TaskStatus status;
        const QString statusValue = obj.value(QStringLiteral("status")).toString();
        if (!Task::statusFromString(statusValue, &status)) {
            result.errors.append(QStringLiteral("task %1 has unknown status \"%2\"").arg(id, statusValue));
        }

        const QJsonValue priority = obj.value(QStringLiteral("priority"));
        if (!priority.isUndefined() && !Task::isKnownPriority(priority.toString())) {
            result.errors.append(QStringLiteral("task %1 has unknown priority \"%2\"").arg(id, priority.toString()));
        }

        const QString parentId = obj.value(QStringLiteral("parentId")).toString();
        if (!parentId.isEmpty()) {
            if (parentId == id) {
                result.errors.append(QStringLiteral("task %1 is its own parent").arg(id));
            }
            parentEdges.append(qMakePair(id, parentId));
        }
    }

    for (const auto &edge : std::as_const(parentEdges)) {
        if (!ids.contains(edge.second)) {
            result.errors.append(QStringLiteral("task %1 references missing parent %2").arg(edge.first, edge.second));
        }
    }

    return result;
}

ValidationResult SessionRegistryValidator::validate(const QJsonDocument &doc) const
{
    ValidationResult result = JsonSyntaxValidator().validate(doc);
    if (!result.isValid()) {
        return result;
    }

    const QJsonObject root = doc.object();
    if (!root.value(QStringLiteral("sessions")).isArray()) {
        result.errors.append(QStringLiteral("missing \"sessions\" array"));
        return result;
    }
    if (!root.value(QStringLiteral("sessionHistory")).isUndefined() && !root.value(QStringLiteral("sessionHistory")).isArray()) {
        result.errors.append(QStringLiteral("\"sessionHistory\" is not an array"));
    }
    if (!root.value(QStringLiteral("config")).isUndefined() && !root.value(QStringLiteral("config")).isObject()) {
        result.errors.append(QStringLiteral("\"config\" is not an object"));
    }

    QSet<QString> ids;
    const QJsonArray sessions = root.value(QStringLiteral("sessions")).toArray();
    for (const QJsonValue &value : sessions) {
        const QJsonObject obj = value.toObject();
        const QString id = obj.value(QStringLiteral("id")).toString();
        if (id.isEmpty()) {
            result.errors.append(QStringLiteral("session without id"));
            continue;
        }
        if (ids.contains(id)) {
            result.errors.append(QStringLiteral("duplicate session id %1").arg(id));
        }
        ids.insert(id);

        Session::Status status;
        if (!Session::statusFromString(obj.value(QStringLiteral("status")).toString(), &status)) {
            result.errors.append(QStringLiteral("session %1 has unknown status").arg(id));
        }

        const QJsonObject scope = obj.value(QStringLiteral("scope")).toObject();
        ScopeType type;
        if (!ScopeDeclaration::typeFromString(scope.value(QStringLiteral("type")).toString(), &type)) {
            result.errors.append(QStringLiteral("session %1 has unknown scope type").arg(id));
        }
        if (scope.value(QStringLiteral("computedTaskIds")).toArray().isEmpty()) {
            result.errors.append(QStringLiteral("session %1 claims no tasks").arg(id));
        }
    }

    return result;
}

} // namespace Taskscope

/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_CHECKSUM_H
#define TASKSCOPE_CHECKSUM_H

#include "taskscope_export.h"

#include <QJsonArray>
#include <QString>

namespace Taskscope
{

namespace Checksum
{

/**
 * First 16 hex characters of the SHA-256 of the compact JSON encoding of
 * @p collection. Stored in a document's _meta.checksum.
 */
TASKSCOPE_EXPORT QString ofCollection(const QJsonArray &collection);

}

} // namespace Taskscope

#endif // TASKSCOPE_CHECKSUM_H

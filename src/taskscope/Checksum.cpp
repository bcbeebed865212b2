/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Checksum.h"

#include <QCryptographicHash>
#include <QJsonDocument>

namespace Taskscope
{

QString Checksum::ofCollection(const QJsonArray &collection)
{
    const QByteArray compact = QJsonDocument(collection).toJson(QJsonDocument::Compact);
    const QByteArray digest = QCryptographicHash::hash(compact, QCryptographicHash::Sha256).toHex();
    return QString::fromLatin1(digest.left(16));
}

} // namespace Taskscope

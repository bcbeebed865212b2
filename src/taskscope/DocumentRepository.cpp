/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "DocumentRepository.h"
#include "AtomicWriter.h"
#include "Checksum.h"
#include "DocumentValidator.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonObject>

namespace Taskscope
{

DocumentRepository::DocumentRepository(const QString &path, const QString &collectionKey, const DocumentValidator *validator, AtomicWriter *writer)
    : m_path(path)
    , m_collectionKey(collectionKey)
    , m_validator(validator)
    , m_writer(writer)
{
}

bool DocumentRepository::exists() const
{
    return QFileInfo::exists(m_path);
}

Status DocumentRepository::readBytes(QByteArray *data) const
{
    QFile file(m_path);
    if (!file.exists()) {
        return Status(ErrorCode::FileNotFound, QStringLiteral("%1 does not exist").arg(m_path));
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Status(ErrorCode::ParseFailed, QStringLiteral("cannot read %1: %2").arg(m_path, file.errorString()));
    }
    *data = file.readAll();
    return Status::ok();
}

Status DocumentRepository::load(QJsonDocument *doc) const
{
    QByteArray data;
    const Status read = readBytes(&data);
    if (!read.isOk()) {
        return read;
    }

    QJsonParseError error;
    const QJsonDocument parsed = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !parsed.isObject()) {
        qWarning() << "DocumentRepository: Malformed document" << m_path << error.errorString();
        return Status(ErrorCode::ParseFailed, QStringLiteral("%1 is not a valid JSON object: %2").arg(m_path, error.errorString()));
    }

    if (m_validator) {
        const ValidationResult validation = m_validator->validate(parsed);
        if (!validation.isValid()) {
            qWarning() << "DocumentRepository: Invalid document" << m_path << validation.errors;
            return Status(ErrorCode::ValidationFailed, validation.errors.join(QStringLiteral("; ")));
        }
    }

    const QJsonObject root = parsed.object();
    const QString stored = root.value(QStringLiteral("_meta")).toObject().value(QStringLiteral("checksum")).toString();
    if (!stored.isEmpty()) {
        const QString actual = Checksum::ofCollection(root.value(m_collectionKey).toArray());
        if (stored != actual) {
            qWarning() << "DocumentRepository: Checksum of" << m_path << "is" << actual << "but _meta says" << stored;
        }
    }

    *doc = parsed;
    return Status::ok();
}

Status DocumentRepository::write(const QJsonDocument &doc)
{
    if (!m_writer || !m_validator) {
        return Status(ErrorCode::InvalidArgument, QStringLiteral("repository for %1 is read-only").arg(m_path));
    }
    return m_writer->write(m_path, doc.toJson(QJsonDocument::Indented), *m_validator);
}

Status DocumentRepository::diskChecksum(QString *checksum) const
{
    QByteArray data;
    const Status read = readBytes(&data);
    if (!read.isOk()) {
        return read;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(data);
    if (!doc.isObject()) {
        return Status(ErrorCode::ParseFailed, QStringLiteral("%1 is not a valid JSON object").arg(m_path));
    }
    *checksum = doc.object().value(QStringLiteral("_meta")).toObject().value(QStringLiteral("checksum")).toString();
    return Status::ok();
}

} // namespace Taskscope

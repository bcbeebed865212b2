/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_DOCUMENTREPOSITORY_H
#define TASKSCOPE_DOCUMENTREPOSITORY_H

#include "taskscope_export.h"

#include "Status.h"

#include <QJsonDocument>
#include <QString>

namespace Taskscope
{

class AtomicWriter;
class DocumentValidator;

/**
 * One lockable, versioned JSON document on disk.
 *
 * Reads parse and validate the whole file. Writes go through the shared
 * AtomicWriter, so every accepted write leaves a backup behind. Locking is
 * left to the caller (FileLock on path()), since lifecycle operations must
 * hold two repositories' locks in a fixed order.
 *
 * @p collectionKey names the array the document's _meta.checksum covers.
 */
class TASKSCOPE_EXPORT DocumentRepository
{
public:
    DocumentRepository(const QString &path, const QString &collectionKey, const DocumentValidator *validator, AtomicWriter *writer);

    QString path() const
    {
        return m_path;
    }

    bool exists() const;

    /**
     * FileNotFound when missing, ParseFailed for malformed JSON,
     * ValidationFailed when the validator rejects the content.
     * A stale _meta.checksum only produces a warning.
     */
    Status load(QJsonDocument *doc) const;

    Status write(const QJsonDocument &doc);

    /**
     * _meta.checksum currently on disk. Used right before committing to spot
     * a writer that bypassed the lock.
     */
    Status diskChecksum(QString *checksum) const;

private:
    Status readBytes(QByteArray *data) const;

    QString m_path;
    QString m_collectionKey;
    const DocumentValidator *m_validator;
    AtomicWriter *m_writer;
};

} // namespace Taskscope

#endif // TASKSCOPE_DOCUMENTREPOSITORY_H

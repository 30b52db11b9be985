/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "manifest.h"
#include "lanxfer_debug.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QtEndian>

#include <algorithm>
#include <cmath>
#include <limits>

bool TransferManifest::operator==(const TransferManifest &other) const
{
    if (kind != other.kind || name != other.name || hashAlgorithm != other.hashAlgorithm
        || timestamp != other.timestamp) {
        return false;
    }
    if (kind == TransferKind::File) {
        return size == other.size && hash == other.hash;
    }
    return totalFiles == other.totalFiles && totalSize == other.totalSize && files == other.files;
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

QByteArray encodeManifest(const TransferManifest &manifest, const TransferTypeTags &tags)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("name"), manifest.name);
    obj.insert(QStringLiteral("hash_algorithm"), manifest.hashAlgorithm);
    obj.insert(QStringLiteral("timestamp"), manifest.timestamp);

    if (manifest.kind == TransferKind::File) {
        obj.insert(QStringLiteral("type"), tags.file);
        obj.insert(QStringLiteral("size"), static_cast<double>(manifest.size));
        obj.insert(QStringLiteral("hash"), manifest.hash);
    } else {
        obj.insert(QStringLiteral("type"), tags.directory);
        obj.insert(QStringLiteral("total_files"), manifest.totalFiles);
        obj.insert(QStringLiteral("total_size"), static_cast<double>(manifest.totalSize));

        QJsonArray files;
        for (const FileEntry &entry : manifest.files) {
            QJsonObject item;
            item.insert(QStringLiteral("path"), entry.path);
            item.insert(QStringLiteral("size"), static_cast<double>(entry.size));
            if (!entry.hash.isEmpty()) {
                item.insert(QStringLiteral("hash"), entry.hash);
            }
            files.append(item);
        }
        obj.insert(QStringLiteral("files"), files);
    }

    const QByteArray body = QJsonDocument(obj).toJson(QJsonDocument::Compact);

    QByteArray frame(MANIFEST_PREFIX_SIZE, Qt::Uninitialized);
    qToBigEndian(static_cast<quint32>(body.size()), reinterpret_cast<uchar *>(frame.data()));
    frame.append(body);
    return frame;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

namespace {

bool readRequiredString(const QJsonObject &obj, const QString &key, QString &out, QString &error)
{
    const QJsonValue value = obj.value(key);
    if (!value.isString()) {
        error = QStringLiteral("Missing or invalid field '%1'").arg(key);
        return false;
    }
    out = value.toString();
    return true;
}

// Non-negative integral JSON number that fits in a qint64
bool readRequiredSize(const QJsonObject &obj, const QString &key, qint64 &out, QString &error)
{
    const QJsonValue value = obj.value(key);
    if (!value.isDouble()) {
        error = QStringLiteral("Missing or invalid field '%1'").arg(key);
        return false;
    }
    // 2^63, the first double above the qint64 range
    constexpr double sizeLimit = 9223372036854775808.0;
    const double d = value.toDouble();
    if (!(d >= 0) || d >= sizeLimit || std::floor(d) != d) {
        error = QStringLiteral("Field '%1' is not a valid size: %2").arg(key).arg(d);
        return false;
    }
    out = static_cast<qint64>(d);
    return true;
}

} // namespace

bool decodeManifestLength(const QByteArray &prefix, quint32 &length, QString &error)
{
    if (prefix.size() != MANIFEST_PREFIX_SIZE) {
        error = QStringLiteral("Manifest length prefix must be %1 bytes, got %2")
                    .arg(MANIFEST_PREFIX_SIZE)
                    .arg(prefix.size());
        return false;
    }
    length = qFromBigEndian<quint32>(reinterpret_cast<const uchar *>(prefix.constData()));
    if (length > LANXFER_MAX_MANIFEST_SIZE) {
        error = QStringLiteral("Metadata too large: %1 bytes").arg(length);
        return false;
    }
    return true;
}

bool decodeManifest(const QByteArray &prefix, const QByteArray &body,
                    TransferManifest &manifest, QString &error,
                    const TransferTypeTags &tags)
{
    quint32 length = 0;
    if (!decodeManifestLength(prefix, length, error)) {
        return false;
    }
    if (static_cast<quint32>(body.size()) != length) {
        error = QStringLiteral("Manifest body is %1 bytes, prefix declared %2")
                    .arg(body.size())
                    .arg(length);
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        error = QStringLiteral("Invalid metadata JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        error = QStringLiteral("Metadata is not a JSON object");
        return false;
    }
    const QJsonObject obj = doc.object();

    TransferManifest result;
    QString type;
    if (!readRequiredString(obj, QStringLiteral("type"), type, error)
        || !readRequiredString(obj, QStringLiteral("name"), result.name, error)
        || !readRequiredString(obj, QStringLiteral("hash_algorithm"), result.hashAlgorithm, error)) {
        return false;
    }

    const QJsonValue timestamp = obj.value(QStringLiteral("timestamp"));
    if (timestamp.isDouble()) {
        result.timestamp = timestamp.toDouble();
    }

    if (type == tags.file) {
        result.kind = TransferKind::File;
        if (!readRequiredSize(obj, QStringLiteral("size"), result.size, error)
            || !readRequiredString(obj, QStringLiteral("hash"), result.hash, error)) {
            return false;
        }
    } else if (type == tags.directory) {
        result.kind = TransferKind::Directory;
        qint64 totalFiles = 0;
        if (!readRequiredSize(obj, QStringLiteral("total_files"), totalFiles, error)
            || !readRequiredSize(obj, QStringLiteral("total_size"), result.totalSize, error)) {
            return false;
        }
        if (totalFiles > std::numeric_limits<int>::max()) {
            error = QStringLiteral("Field 'total_files' is out of range: %1").arg(totalFiles);
            return false;
        }
        result.totalFiles = static_cast<int>(totalFiles);

        const QJsonValue files = obj.value(QStringLiteral("files"));
        if (!files.isArray()) {
            error = QStringLiteral("Missing or invalid field 'files'");
            return false;
        }
        const QJsonArray array = files.toArray();
        for (const QJsonValue &item : array) {
            if (!item.isObject()) {
                error = QStringLiteral("File entry is not an object");
                return false;
            }
            const QJsonObject itemObj = item.toObject();
            FileEntry entry;
            if (!readRequiredString(itemObj, QStringLiteral("path"), entry.path, error)
                || !readRequiredSize(itemObj, QStringLiteral("size"), entry.size, error)) {
                return false;
            }
            const QJsonValue hash = itemObj.value(QStringLiteral("hash"));
            if (hash.isString()) {
                entry.hash = hash.toString();
            } else if (!hash.isUndefined() && !hash.isNull()) {
                error = QStringLiteral("Invalid hash for entry '%1'").arg(entry.path);
                return false;
            }
            result.files.append(entry);
        }
    } else {
        error = QStringLiteral("Unknown transfer type: %1").arg(type);
        return false;
    }

    manifest = result;
    return true;
}

// ---------------------------------------------------------------------------
// Directory scanning
// ---------------------------------------------------------------------------

bool collectDirectoryFiles(const QString &root, QList<FileEntry> &entries,
                           qint64 &totalSize, QString &error)
{
    const QFileInfo rootInfo(root);
    if (!rootInfo.isDir()) {
        error = QStringLiteral("Directory not found: %1").arg(root);
        return false;
    }

    const QDir base(rootInfo.absoluteFilePath());
    QList<FileEntry> found;
    qint64 total = 0;

    QDirIterator it(base.absolutePath(),
                    QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo info = it.fileInfo();
        if (!info.isFile()) {
            continue;
        }
        FileEntry entry;
        entry.path = base.relativeFilePath(info.absoluteFilePath());
        entry.size = info.size();
        total += entry.size;
        found.append(entry);
    }

    std::sort(found.begin(), found.end(), [](const FileEntry &a, const FileEntry &b) {
        return a.path < b.path;
    });

    qCDebug(LANXFER_LOG) << "Scanned" << root << "files:" << found.size() << "bytes:" << total;
    entries = found;
    totalSize = total;
    return true;
}

bool isSafeRelativePath(const QString &path)
{
    if (path.isEmpty() || path.startsWith(QLatin1Char('/')) || path.contains(QLatin1Char('\\'))
        || QDir::isAbsolutePath(path)) {
        return false;
    }
    const QStringList parts = path.split(QLatin1Char('/'));
    for (const QString &part : parts) {
        if (part.isEmpty() || part == QLatin1String(".") || part == QLatin1String("..")) {
            return false;
        }
    }
    return true;
}

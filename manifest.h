/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef MANIFEST_H
#define MANIFEST_H

#include <QByteArray>
#include <QList>
#include <QString>

#include "lanxfer_config.h"

// Wire layout:
//   [4 bytes: uint32 big-endian body length N][N bytes: UTF-8 JSON manifest]
// followed by the raw payload bytes.
constexpr int MANIFEST_PREFIX_SIZE = 4;

enum class TransferKind {
    File,
    Directory,
};

struct FileEntry {
    QString path;       // relative, '/' separated
    qint64 size = 0;
    QString hash;       // may be empty

    bool operator==(const FileEntry &other) const
    {
        return path == other.path && size == other.size && hash == other.hash;
    }
    bool operator!=(const FileEntry &other) const { return !(*this == other); }
};

struct TransferManifest {
    TransferKind kind = TransferKind::File;
    QString name;
    QString hashAlgorithm;
    double timestamp = 0.0;     // seconds since epoch, informational

    // File transfers
    qint64 size = 0;
    QString hash;

    // Directory transfers, in streaming order
    int totalFiles = 0;
    qint64 totalSize = 0;
    QList<FileEntry> files;

    bool operator==(const TransferManifest &other) const;
    bool operator!=(const TransferManifest &other) const { return !(*this == other); }

    // Bytes that follow the manifest on the wire
    qint64 payloadSize() const { return kind == TransferKind::File ? size : totalSize; }
};

QByteArray encodeManifest(const TransferManifest &manifest,
                          const TransferTypeTags &tags = TransferTypeTags());

// Validates the 4-byte prefix and the size cap
bool decodeManifestLength(const QByteArray &prefix, quint32 &length, QString &error);

// Structural decoding only; no semantic checks
bool decodeManifest(const QByteArray &prefix, const QByteArray &body,
                    TransferManifest &manifest, QString &error,
                    const TransferTypeTags &tags = TransferTypeTags());

// Recursively lists regular files under `root` (hidden files included,
// symlinked directories not descended), sorted by relative path.
bool collectDirectoryFiles(const QString &root, QList<FileEntry> &entries,
                           qint64 &totalSize, QString &error);

// True for a non-empty relative path with no "..", "." or empty components
bool isSafeRelativePath(const QString &path);

#endif // MANIFEST_H

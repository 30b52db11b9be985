/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef LANXFER_CONFIG_H
#define LANXFER_CONFIG_H

#include <QString>

constexpr quint16 LANXFER_DEFAULT_PORT = 5001;
constexpr int LANXFER_DEFAULT_BUFFER_SIZE = 64 * 1024;
constexpr int LANXFER_DEFAULT_HASH_CHUNK_SIZE = 1024 * 1024;

// Hard cap on the manifest body, bounds memory use against a bad peer
constexpr quint32 LANXFER_MAX_MANIFEST_SIZE = 10 * 1024 * 1024;

// Longest acknowledgment read, whatever the accepted tokens are
constexpr int LANXFER_MAX_ACK_LENGTH = 1024;

// Free space must exceed the declared total by this margin (percent)
constexpr int LANXFER_SPACE_MARGIN_PERCENT = 10;

struct TransferTypeTags {
    QString file = QStringLiteral("file");
    QString directory = QStringLiteral("directory");
};

struct TransferConfig {
    quint16 port = LANXFER_DEFAULT_PORT;
    int bufferSize = LANXFER_DEFAULT_BUFFER_SIZE;
    int hashChunkSize = LANXFER_DEFAULT_HASH_CHUNK_SIZE;
    QString hashAlgorithm = QStringLiteral("sha256");
    bool skipHashVerification = false;
    QString receivedDir = QStringLiteral("received_files");
    TransferTypeTags transferTypes;

    // Timeouts in milliseconds
    int serverTimeoutMs = 1000;     // accept poll interval
    int startupTimeoutMs = 5000;    // wait for bind + listen
    int connectTimeoutMs = 30000;
    int ioTimeoutMs = 30000;
    int ackTimeoutMs = 30000;
    int entryAckTimeoutMs = 60000;
    int ackSendTimeoutMs = 10000;

    // Zero-length liveness probe every N chunks of a directory entry
    int livenessProbeInterval = 100;

    // 0 keeps the historical unbounded handler count
    int maxConcurrentHandlers = 0;

    int progressIntervalMs = 100;
};

// Reads a JSON configuration file using the historical key names
// (PORT, BUFFER_SIZE, HASH_ALGORITHM, ...). Keys absent from the file keep
// their default value. Returns false and fills `error` on failure.
bool loadTransferConfig(const QString &path, TransferConfig &config, QString &error);

// Checks value ranges and the hash algorithm name
bool validateTransferConfig(const TransferConfig &config, QString &error);

#endif // LANXFER_CONFIG_H

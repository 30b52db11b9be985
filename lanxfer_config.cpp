/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "lanxfer_config.h"
#include "integrity.h"
#include "lanxfer_debug.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <cmath>

namespace {

bool readInt(const QJsonObject &obj, const char *key, int &out, QString &error)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isDouble()) {
        error = QStringLiteral("%1 must be a number").arg(QLatin1String(key));
        return false;
    }
    out = value.toInt();
    return true;
}

// Timeouts are stored in seconds in the file
bool readSeconds(const QJsonObject &obj, const char *key, int &outMs, QString &error)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isDouble()) {
        error = QStringLiteral("%1 must be a number of seconds").arg(QLatin1String(key));
        return false;
    }
    outMs = static_cast<int>(std::lround(value.toDouble() * 1000.0));
    return true;
}

bool readString(const QJsonObject &obj, const char *key, QString &out, QString &error)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isString()) {
        error = QStringLiteral("%1 must be a string").arg(QLatin1String(key));
        return false;
    }
    out = value.toString();
    return true;
}

bool readBool(const QJsonObject &obj, const char *key, bool &out, QString &error)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isBool()) {
        error = QStringLiteral("%1 must be true or false").arg(QLatin1String(key));
        return false;
    }
    out = value.toBool();
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

bool loadTransferConfig(const QString &path, TransferConfig &config, QString &error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = QStringLiteral("Cannot open configuration %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        error = QStringLiteral("Invalid configuration %1: %2").arg(path, parseError.errorString());
        return false;
    }

    const QJsonObject obj = doc.object();
    TransferConfig loaded = config;

    int port = loaded.port;
    if (!readInt(obj, "PORT", port, error)
        || !readInt(obj, "BUFFER_SIZE", loaded.bufferSize, error)
        || !readInt(obj, "HASH_CHUNK_SIZE", loaded.hashChunkSize, error)
        || !readString(obj, "HASH_ALGORITHM", loaded.hashAlgorithm, error)
        || !readBool(obj, "SKIP_HASH_VERIFICATION", loaded.skipHashVerification, error)
        || !readString(obj, "RECEIVED_DIR", loaded.receivedDir, error)
        || !readSeconds(obj, "SERVER_TIMEOUT", loaded.serverTimeoutMs, error)
        || !readSeconds(obj, "CONNECT_TIMEOUT", loaded.connectTimeoutMs, error)
        || !readSeconds(obj, "IO_TIMEOUT", loaded.ioTimeoutMs, error)
        || !readSeconds(obj, "ACK_TIMEOUT", loaded.ackTimeoutMs, error)
        || !readSeconds(obj, "ENTRY_ACK_TIMEOUT", loaded.entryAckTimeoutMs, error)
        || !readSeconds(obj, "ACK_SEND_TIMEOUT", loaded.ackSendTimeoutMs, error)
        || !readInt(obj, "LIVENESS_PROBE_INTERVAL", loaded.livenessProbeInterval, error)
        || !readInt(obj, "MAX_CONCURRENT_HANDLERS", loaded.maxConcurrentHandlers, error)
        || !readInt(obj, "PROGRESS_INTERVAL_MS", loaded.progressIntervalMs, error)) {
        return false;
    }

    if (port <= 0 || port > 65535) {
        error = QStringLiteral("PORT out of range: %1").arg(port);
        return false;
    }
    loaded.port = static_cast<quint16>(port);

    const QJsonValue types = obj.value(QLatin1String("TRANSFER_TYPES"));
    if (!types.isUndefined()) {
        if (!types.isObject()) {
            error = QStringLiteral("TRANSFER_TYPES must be an object");
            return false;
        }
        const QJsonObject typesObj = types.toObject();
        if (!readString(typesObj, "FILE", loaded.transferTypes.file, error)
            || !readString(typesObj, "DIRECTORY", loaded.transferTypes.directory, error)) {
            return false;
        }
    }

    if (!validateTransferConfig(loaded, error)) {
        return false;
    }

    qCDebug(LANXFER_LOG) << "Loaded configuration" << path
                         << "port:" << loaded.port
                         << "buffer:" << loaded.bufferSize
                         << "hash:" << loaded.hashAlgorithm
                         << "skip verification:" << loaded.skipHashVerification;
    config = loaded;
    return true;
}

bool validateTransferConfig(const TransferConfig &config, QString &error)
{
    if (config.bufferSize <= 0) {
        error = QStringLiteral("BUFFER_SIZE must be positive");
        return false;
    }
    if (config.hashChunkSize <= 0) {
        error = QStringLiteral("HASH_CHUNK_SIZE must be positive");
        return false;
    }
    if (!isSupportedHashAlgorithm(config.hashAlgorithm)) {
        error = QStringLiteral("Unsupported HASH_ALGORITHM: %1").arg(config.hashAlgorithm);
        return false;
    }
    if (config.transferTypes.file.isEmpty() || config.transferTypes.directory.isEmpty()
        || config.transferTypes.file == config.transferTypes.directory) {
        error = QStringLiteral("TRANSFER_TYPES must name two distinct tags");
        return false;
    }
    if (config.serverTimeoutMs <= 0 || config.connectTimeoutMs <= 0 || config.ioTimeoutMs <= 0
        || config.ackTimeoutMs <= 0 || config.entryAckTimeoutMs <= 0 || config.ackSendTimeoutMs <= 0) {
        error = QStringLiteral("Timeouts must be positive");
        return false;
    }
    if (config.livenessProbeInterval <= 0) {
        error = QStringLiteral("LIVENESS_PROBE_INTERVAL must be positive");
        return false;
    }
    if (config.maxConcurrentHandlers < 0) {
        error = QStringLiteral("MAX_CONCURRENT_HANDLERS cannot be negative");
        return false;
    }
    return true;
}

/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "transfer_sender.h"
#include "ack_protocol.h"
#include "integrity.h"
#include "lanxfer_debug.h"
#include "transfer_socket.h"

#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>

#include <KLocalizedString>

#include <vector>

namespace {

double nowSeconds()
{
    return QDateTime::currentMSecsSinceEpoch() / 1000.0;
}

// Turns a failed acknowledgment wait into an error
TransferError ackError(const AckResult &ack, TransferPhase phase, const QString &waitingFor)
{
    TransferError error;
    error.phase = phase;
    error.response = ack.raw;

    switch (ack.status) {
    case AckStatus::Matched:
        break;
    case AckStatus::Timeout:
        error.kind = ErrorKind::Timeout;
        error.detail = QStringLiteral("Timeout waiting for %1").arg(waitingFor);
        break;
    case AckStatus::UnexpectedResponse:
        error.kind = ErrorKind::Protocol;
        error.detail = QStringLiteral("Unexpected response while waiting for %1: %2")
                           .arg(waitingFor, QString::fromUtf8(ack.raw));
        break;
    case AckStatus::ConnectionLost:
        error.kind = ErrorKind::ConnectionLost;
        error.detail = QStringLiteral("Connection closed while waiting for %1").arg(waitingFor);
        break;
    case AckStatus::NetworkError:
        error.kind = ErrorKind::Network;
        error.detail = QStringLiteral("Socket error while waiting for %1: %2")
                           .arg(waitingFor, QString::fromUtf8(ack.raw));
        break;
    }
    return error;
}

TransferError spaceError(TransferPhase phase)
{
    TransferError error(ErrorKind::DiskSpace, phase, QStringLiteral("Receiver reported insufficient disk space"));
    error.response = TOKEN_SPACE_ERROR;
    return error;
}

// The receiver only speaks out of turn to refuse a directory for lack of
// space; whatever it sent stays readable after it closed the connection.
bool peerRefusedSpace(TransferSocket &socket)
{
    const int length = static_cast<int>(sizeof(TOKEN_SPACE_ERROR)) - 1;
    return socket.socket().peek(length) == QByteArray(TOKEN_SPACE_ERROR);
}

} // namespace

TransferSender::TransferSender(const TransferConfig &config, TransferObserver *observer)
    : m_config(config)
    , m_observer(observer)
{
}

bool TransferSender::fail(const TransferError &error)
{
    m_lastError = error;
    qCWarning(LANXFER_LOG) << "Send failed:" << errorKindName(error.kind)
                           << "phase:" << phaseName(error.phase) << error.detail;
    if (m_observer) {
        m_observer->transferFailed(error);
        m_observer->statusMessage(StatusLevel::Error, error.toString());
    }
    return false;
}

void TransferSender::status(StatusLevel level, const QString &message)
{
    if (m_observer) {
        m_observer->statusMessage(level, message);
    }
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------

bool TransferSender::negotiate(TransferSocket &socket, const TransferManifest &manifest,
                               const QHostAddress &target, const QHostAddress &local)
{
    status(StatusLevel::Info, i18n("Connecting to %1...", target.toString()));
    if (!socket.connectToHost(target, m_config.port, local)) {
        return fail(socket.lastError());
    }
    status(StatusLevel::Success, i18n("Connected to receiver at %1", socket.peerDescription()));

    const QByteArray frame = encodeManifest(manifest, m_config.transferTypes);
    qCDebug(LANXFER_LOG) << "Sending manifest" << manifest.name
                         << "bytes:" << frame.size() - MANIFEST_PREFIX_SIZE;
    if (!socket.writeAll(frame)) {
        TransferError error = socket.lastError();
        error.phase = TransferPhase::Handshake;
        return fail(error);
    }

    const AckResult ack = awaitAck(socket, {TOKEN_ACK1, TOKEN_MISMATCH}, m_config.ackTimeoutMs);
    if (ack.status != AckStatus::Matched) {
        return fail(ackError(ack, TransferPhase::Handshake, QStringLiteral("metadata acknowledgment")));
    }
    if (ack.token == TOKEN_MISMATCH) {
        return fail(TransferError(ErrorKind::HashAlgorithmRejected, TransferPhase::Handshake,
                                  QStringLiteral("receiver rejected %1").arg(m_config.hashAlgorithm)));
    }
    return true;
}

// ---------------------------------------------------------------------------
// Payload
// ---------------------------------------------------------------------------

bool TransferSender::streamFile(TransferSocket &socket, const QString &sourcePath, qint64 declaredSize,
                                int probeInterval, ProgressThrottle &progress, qint64 &sentTotal,
                                TransferError &error)
{
    QFile file(sourcePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = TransferError(ErrorKind::LocalIO, TransferPhase::Send,
                              QStringLiteral("Error reading file %1: %2")
                                  .arg(sourcePath, file.errorString()));
        return false;
    }

    std::vector<char> buffer(static_cast<size_t>(m_config.bufferSize));
    qint64 sent = 0;
    int chunkCount = 0;

    while (sent < declaredSize) {
        const qint64 want = qMin<qint64>(static_cast<qint64>(buffer.size()), declaredSize - sent);
        const qint64 n = file.read(buffer.data(), want);
        if (n < 0) {
            socket.abort();
            error = TransferError(ErrorKind::LocalIO, TransferPhase::Send,
                                  QStringLiteral("Error reading file %1: %2")
                                      .arg(sourcePath, file.errorString()));
            return false;
        }
        if (n == 0) {
            // The file shrank since it was described; the receiver can only
            // see this as a truncated stream, so drop the connection.
            socket.abort();
            error = TransferError(ErrorKind::SizeMismatch, TransferPhase::Send,
                                  QStringLiteral("%1 ended after %2 of %3 declared bytes")
                                      .arg(sourcePath)
                                      .arg(sent)
                                      .arg(declaredSize));
            error.bytesTransferred = sent;
            error.bytesExpected = declaredSize;
            return false;
        }

        if (!socket.writeAll(buffer.data(), n)) {
            error = socket.lastError();
            error.bytesTransferred = sent;
            error.bytesExpected = declaredSize;
            error.detail = QStringLiteral("%1 at %2/%3 bytes: %4")
                               .arg(QFileInfo(sourcePath).fileName())
                               .arg(sent)
                               .arg(declaredSize)
                               .arg(error.detail);
            return false;
        }
        sent += n;
        sentTotal += n;
        progress.update(sentTotal);
        ++chunkCount;

        if (probeInterval > 0 && chunkCount % probeInterval == 0 && !socket.probeLiveness()) {
            error = socket.lastError();
            error.detail = QStringLiteral("Connection lost during %1 (chunk %2)")
                               .arg(QFileInfo(sourcePath).fileName())
                               .arg(chunkCount);
            error.bytesTransferred = sent;
            error.bytesExpected = declaredSize;
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Single file
// ---------------------------------------------------------------------------

bool TransferSender::sendFile(const QString &path, const QHostAddress &target, const QHostAddress &local)
{
    m_lastError = TransferError();

    const QFileInfo info(path);
    if (!info.isFile()) {
        return fail(TransferError(ErrorKind::LocalIO, TransferPhase::None,
                                  QStringLiteral("File not found: %1").arg(path)));
    }

    TransferManifest manifest;
    manifest.kind = TransferKind::File;
    manifest.name = info.fileName();
    manifest.hashAlgorithm = m_config.hashAlgorithm;
    manifest.timestamp = nowSeconds();
    manifest.size = info.size();

    status(StatusLevel::Info, i18n("Calculating file hash..."));
    TransferError hashError;
    if (!hashFile(info.absoluteFilePath(), m_config.hashAlgorithm, m_config.hashChunkSize,
                  manifest.hash, hashError)) {
        return fail(hashError);
    }

    QElapsedTimer elapsed;
    elapsed.start();

    TransferSocket socket(m_config.connectTimeoutMs);
    if (!negotiate(socket, manifest, target, local)) {
        return false;
    }
    socket.setTimeout(m_config.ioTimeoutMs);

    status(StatusLevel::Info, i18n("Sending %1 (%2)", manifest.name, formatSize(manifest.size)));
    ProgressThrottle progress(m_observer, manifest.size, m_config.progressIntervalMs);
    progress.update(0);
    qint64 sent = 0;
    TransferError streamError;
    if (!streamFile(socket, info.absoluteFilePath(), manifest.size, 0, progress, sent, streamError)) {
        return fail(streamError);
    }
    progress.finish();

    const AckResult done = awaitAck(socket, {TOKEN_DONE}, m_config.ackTimeoutMs);
    if (done.status != AckStatus::Matched) {
        return fail(ackError(done, TransferPhase::Acknowledge, QStringLiteral("completion acknowledgment")));
    }

    qCInfo(LANXFER_LOG) << "Sent" << manifest.name << manifest.size << "bytes to"
                        << socket.peerDescription() << "in" << elapsed.elapsed() << "ms";
    status(StatusLevel::Success, i18n("File sent successfully!"));
    if (m_observer) {
        m_observer->transferCompleted(manifest, socket.peerDescription());
    }
    return true;
}

// ---------------------------------------------------------------------------
// Directory
// ---------------------------------------------------------------------------

bool TransferSender::sendDirectory(const QString &path, const QHostAddress &target, const QHostAddress &local)
{
    m_lastError = TransferError();

    const QFileInfo info(path);
    if (!info.isDir()) {
        return fail(TransferError(ErrorKind::LocalIO, TransferPhase::None,
                                  QStringLiteral("Directory not found: %1").arg(path)));
    }
    const QDir root(info.absoluteFilePath());

    TransferManifest manifest;
    manifest.kind = TransferKind::Directory;
    manifest.name = root.dirName();
    manifest.hashAlgorithm = m_config.hashAlgorithm;
    manifest.timestamp = nowSeconds();

    status(StatusLevel::Info, i18n("Scanning directory..."));
    QString scanError;
    if (!collectDirectoryFiles(root.absolutePath(), manifest.files, manifest.totalSize, scanError)) {
        return fail(TransferError(ErrorKind::LocalIO, TransferPhase::None, scanError));
    }
    if (manifest.files.isEmpty()) {
        return fail(TransferError(ErrorKind::LocalIO, TransferPhase::None,
                                  QStringLiteral("No files found in directory %1").arg(path)));
    }
    manifest.totalFiles = manifest.files.size();
    status(StatusLevel::Info, i18np("%1 file, total size: %2", "%1 files, total size: %2",
                                    manifest.totalFiles, formatSize(manifest.totalSize)));

    status(StatusLevel::Info, i18n("Calculating file hashes..."));
    for (FileEntry &entry : manifest.files) {
        TransferError hashError;
        if (!hashFile(root.filePath(entry.path), m_config.hashAlgorithm, m_config.hashChunkSize,
                      entry.hash, hashError)) {
            hashError.entryPath = entry.path;
            return fail(hashError);
        }
    }

    QElapsedTimer elapsed;
    elapsed.start();

    TransferSocket socket(m_config.connectTimeoutMs);
    socket.socket().setSocketOption(QAbstractSocket::KeepAliveOption, 1);
    if (!negotiate(socket, manifest, target, local)) {
        return false;
    }
    socket.setTimeout(m_config.ioTimeoutMs);

    ProgressThrottle progress(m_observer, manifest.totalSize, m_config.progressIntervalMs);
    progress.update(0);
    qint64 sentTotal = 0;
    QString lastSuccessful;

    for (int i = 0; i < manifest.files.size(); ++i) {
        const FileEntry &entry = manifest.files.at(i);
        status(StatusLevel::Info, QStringLiteral("[%1/%2] %3").arg(i + 1).arg(manifest.totalFiles).arg(entry.path));

        auto withContext = [&](TransferError error) {
            error.entryPath = entry.path;
            error.filesCompleted = i;
            error.totalFiles = manifest.totalFiles;
            error.lastSuccessfulEntry = lastSuccessful;
            return error;
        };

        if (peerRefusedSpace(socket)) {
            return fail(withContext(spaceError(TransferPhase::Send)));
        }
        if (!socket.probeLiveness()) {
            if (peerRefusedSpace(socket)) {
                return fail(withContext(spaceError(TransferPhase::Send)));
            }
            TransferError error = socket.lastError();
            error.detail = QStringLiteral("Connection lost before sending %1").arg(entry.path);
            return fail(withContext(error));
        }

        TransferError streamError;
        if (!streamFile(socket, root.filePath(entry.path), entry.size,
                        m_config.livenessProbeInterval, progress, sentTotal, streamError)) {
            if (streamError.kind != ErrorKind::LocalIO && streamError.kind != ErrorKind::SizeMismatch
                && peerRefusedSpace(socket)) {
                streamError = spaceError(TransferPhase::Send);
            }
            return fail(withContext(streamError));
        }

        const AckResult ack = awaitAck(socket, {TOKEN_ACK2, TOKEN_SPACE_ERROR}, m_config.entryAckTimeoutMs);
        if (ack.status == AckStatus::Matched && ack.token == TOKEN_SPACE_ERROR) {
            return fail(withContext(spaceError(TransferPhase::Acknowledge)));
        }
        if (ack.status != AckStatus::Matched) {
            return fail(withContext(ackError(ack, TransferPhase::Acknowledge,
                                             QStringLiteral("acknowledgment of %1 (file %2/%3)")
                                                 .arg(entry.path)
                                                 .arg(i + 1)
                                                 .arg(manifest.totalFiles))));
        }
        lastSuccessful = entry.path;
        qCDebug(LANXFER_LOG) << "Entry acknowledged" << entry.path;
    }
    progress.finish();

    const AckResult done = awaitAck(socket, {TOKEN_DONE}, m_config.ackTimeoutMs);
    if (done.status != AckStatus::Matched) {
        return fail(ackError(done, TransferPhase::Acknowledge, QStringLiteral("final completion acknowledgment")));
    }

    qCInfo(LANXFER_LOG) << "Sent directory" << manifest.name << manifest.totalFiles << "files,"
                        << manifest.totalSize << "bytes to" << socket.peerDescription()
                        << "in" << elapsed.elapsed() << "ms";
    status(StatusLevel::Success, i18n("Directory sent successfully!"));
    if (m_observer) {
        m_observer->transferCompleted(manifest, socket.peerDescription());
    }
    return true;
}

/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "transfer_receiver.h"
#include "ack_protocol.h"
#include "lanxfer_debug.h"
#include "transfer_socket.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QStorageInfo>
#include <QTemporaryDir>
#include <QTemporaryFile>

#include <KLocalizedString>

#include <cerrno>
#include <cstdio>
#include <limits>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace {

const QFileDevice::Permissions publishedFilePermissions = QFileDevice::ReadOwner | QFileDevice::WriteOwner
    | QFileDevice::ReadUser | QFileDevice::WriteUser | QFileDevice::ReadGroup | QFileDevice::ReadOther;

const QFileDevice::Permissions publishedDirPermissions = publishedFilePermissions | QFileDevice::ExeOwner
    | QFileDevice::ExeUser | QFileDevice::ExeGroup | QFileDevice::ExeOther;

// Rename that replaces an existing target in one step
bool replaceFile(const QString &from, const QString &to, int &osError)
{
#ifdef Q_OS_WIN
    if (MoveFileExW(reinterpret_cast<const wchar_t *>(QDir::toNativeSeparators(from).utf16()),
                    reinterpret_cast<const wchar_t *>(QDir::toNativeSeparators(to).utf16()),
                    MOVEFILE_REPLACE_EXISTING)) {
        return true;
    }
    osError = static_cast<int>(GetLastError());
    return false;
#else
    if (::rename(QFile::encodeName(from).constData(), QFile::encodeName(to).constData()) == 0) {
        return true;
    }
    osError = errno;
    return false;
#endif
}

TransferError protocolError(const QString &detail)
{
    return TransferError(ErrorKind::Protocol, TransferPhase::Handshake, detail);
}

} // namespace

bool hasSufficientSpace(qint64 available, qint64 required)
{
    // required * (1 + margin) without going through floating point
    const qint64 margin = required / 100 * LANXFER_SPACE_MARGIN_PERCENT
        + required % 100 * LANXFER_SPACE_MARGIN_PERCENT / 100;
    if (required > std::numeric_limits<qint64>::max() - margin) {
        return false;
    }
    return available > required + margin;
}

TransferReceiver::TransferReceiver(const TransferConfig &config, ValidationLog *validations,
                                   TransferObserver *observer)
    : m_config(config)
    , m_validations(validations)
    , m_observer(observer)
    , m_verifier(config)
    , m_buffer(static_cast<size_t>(config.bufferSize))
{
}

bool TransferReceiver::fail(const TransferError &error)
{
    m_lastError = error;
    qCWarning(LANXFER_LOG) << "Receive failed:" << errorKindName(error.kind)
                           << "phase:" << phaseName(error.phase) << error.detail;
    if (m_observer) {
        m_observer->transferFailed(error);
        m_observer->statusMessage(StatusLevel::Error, error.toString());
    }
    return false;
}

void TransferReceiver::status(StatusLevel level, const QString &message)
{
    if (m_observer) {
        m_observer->statusMessage(level, message);
    }
}

bool TransferReceiver::handleConnection(TransferSocket &socket)
{
    m_lastError = TransferError();
    QElapsedTimer elapsed;
    elapsed.start();

    TransferManifest manifest;
    bool ok = readManifest(socket, manifest) && checkManifest(manifest);
    if (ok) {
        qCDebug(LANXFER_LOG) << "Manifest from" << socket.peerDescription() << manifest.name
                             << "payload:" << manifest.payloadSize();
        if (m_observer) {
            m_observer->transferStarted(manifest, socket.peerDescription());
        }
        ok = negotiate(socket, manifest);
    }
    if (ok) {
        ok = manifest.kind == TransferKind::File ? receiveFile(socket, manifest)
                                                 : receiveDirectory(socket, manifest);
    }
    socket.close();

    if (ok) {
        qCInfo(LANXFER_LOG) << "Received" << manifest.name << manifest.payloadSize() << "bytes from"
                            << socket.peerDescription() << "in" << elapsed.elapsed() << "ms";
    }
    return ok;
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------

bool TransferReceiver::readManifest(TransferSocket &socket, TransferManifest &manifest)
{
    QByteArray prefix(MANIFEST_PREFIX_SIZE, Qt::Uninitialized);
    if (!socket.readExact(prefix.data(), prefix.size())) {
        TransferError error = socket.lastError();
        error.phase = TransferPhase::Handshake;
        return fail(error);
    }

    quint32 length = 0;
    QString decodeError;
    if (!decodeManifestLength(prefix, length, decodeError)) {
        return fail(protocolError(decodeError));
    }

    QByteArray body(static_cast<int>(length), Qt::Uninitialized);
    if (!socket.readExact(body.data(), body.size())) {
        TransferError error = socket.lastError();
        error.phase = TransferPhase::Handshake;
        return fail(error);
    }

    if (!decodeManifest(prefix, body, manifest, decodeError, m_config.transferTypes)) {
        return fail(protocolError(decodeError));
    }
    return true;
}

bool TransferReceiver::checkManifest(const TransferManifest &manifest)
{
    if (!isSafeRelativePath(manifest.name) || manifest.name.contains(QLatin1Char('/'))) {
        return fail(protocolError(QStringLiteral("Refusing unsafe name \"%1\"").arg(manifest.name)));
    }
    if (manifest.kind == TransferKind::File) {
        return true;
    }

    qint64 total = 0;
    for (const FileEntry &entry : manifest.files) {
        if (!isSafeRelativePath(entry.path)) {
            return fail(protocolError(QStringLiteral("Refusing unsafe entry path \"%1\"").arg(entry.path)));
        }
        if (entry.size > std::numeric_limits<qint64>::max() - total) {
            return fail(protocolError(QStringLiteral("Entry sizes overflow at \"%1\"").arg(entry.path)));
        }
        total += entry.size;
    }
    if (manifest.totalFiles != manifest.files.size() || manifest.totalSize != total) {
        return fail(protocolError(QStringLiteral("Manifest totals (%1 files, %2 bytes) do not match its entries (%3 files, %4 bytes)")
                                      .arg(manifest.totalFiles)
                                      .arg(manifest.totalSize)
                                      .arg(manifest.files.size())
                                      .arg(total)));
    }
    return true;
}

bool TransferReceiver::negotiate(TransferSocket &socket, const TransferManifest &manifest)
{
    if (!sameHashAlgorithm(manifest.hashAlgorithm, m_config.hashAlgorithm)) {
        if (!m_config.skipHashVerification) {
            qCWarning(LANXFER_LOG) << "Rejecting" << manifest.hashAlgorithm << "- configured for"
                                   << m_config.hashAlgorithm;
            if (!sendAck(socket, TOKEN_MISMATCH, m_config.ackSendTimeoutMs)) {
                qCWarning(LANXFER_LOG) << "Could not deliver MISMATCH:" << socket.lastError().detail;
            }
            return fail(TransferError(ErrorKind::HashAlgorithmRejected, TransferPhase::Handshake,
                                      QStringLiteral("sender uses %1, receiver is configured for %2")
                                          .arg(manifest.hashAlgorithm, m_config.hashAlgorithm)));
        }
        status(StatusLevel::Warning, i18n("Hash algorithm mismatch (%1 vs %2), verification is disabled",
                                          manifest.hashAlgorithm, m_config.hashAlgorithm));
    }

    if (!sendAck(socket, TOKEN_ACK1, m_config.ackSendTimeoutMs)) {
        TransferError error = socket.lastError();
        error.phase = TransferPhase::Handshake;
        return fail(error);
    }
    return true;
}

// ---------------------------------------------------------------------------
// Payload
// ---------------------------------------------------------------------------

bool TransferReceiver::receivePayload(TransferSocket &socket, QFileDevice &out, qint64 size,
                                      ProgressThrottle &progress, qint64 &receivedTotal, TransferError &error)
{
    qint64 received = 0;
    while (received < size) {
        const qint64 want = qMin<qint64>(static_cast<qint64>(m_buffer.size()), size - received);
        const qint64 n = socket.readSome(m_buffer.data(), want);
        if (n == 0) {
            error = TransferError(ErrorKind::ConnectionLost, TransferPhase::Receive,
                                  QStringLiteral("Connection lost after %1/%2 bytes").arg(received).arg(size));
        } else if (n < 0) {
            error = socket.lastError();
            error.phase = TransferPhase::Receive;
        } else if (out.write(m_buffer.data(), n) != n) {
            const int osError = errno;
            error = TransferError(classifyOsError(osError, ErrorKind::LocalIO), TransferPhase::Receive,
                                  QStringLiteral("Error writing %1: %2").arg(out.fileName(), out.errorString()),
                                  osError);
        } else {
            received += n;
            receivedTotal += n;
            progress.update(receivedTotal);
            continue;
        }
        error.bytesTransferred = received;
        error.bytesExpected = size;
        return false;
    }

    if (!out.flush()) {
        const int osError = errno;
        error = TransferError(classifyOsError(osError, ErrorKind::LocalIO), TransferPhase::Receive,
                              QStringLiteral("Error writing %1: %2").arg(out.fileName(), out.errorString()),
                              osError);
        return false;
    }
    return true;
}

bool TransferReceiver::verifyReceived(const QString &stagedPath, const QString &reportedPath,
                                      const QString &expectedHash, VerifyResult &result)
{
    if (!m_verifier.verify(stagedPath, expectedHash, result)) {
        return false;
    }
    if (result == VerifyResult::Mismatch) {
        const FailedValidation failure{reportedPath, digestPrefix(expectedHash), digestPrefix(m_verifier.lastDigest())};
        if (m_validations) {
            m_validations->record(failure);
        }
        if (m_observer) {
            m_observer->integrityFailure(failure);
        }
        status(StatusLevel::Warning, i18n("Hash verification failed for %1", reportedPath));
    }
    return true;
}

// ---------------------------------------------------------------------------
// Single file
// ---------------------------------------------------------------------------

bool TransferReceiver::receiveFile(TransferSocket &socket, const TransferManifest &manifest)
{
    const QDir root(m_config.receivedDir);
    if (!QDir().mkpath(root.absolutePath())) {
        return fail(TransferError(ErrorKind::LocalIO, TransferPhase::Receive,
                                  QStringLiteral("Cannot create %1").arg(root.absolutePath())));
    }
    const QString finalPath = root.absoluteFilePath(manifest.name);

    QTemporaryFile temp(root.absoluteFilePath(QStringLiteral(".%1_XXXXXX.tmp").arg(manifest.name)));
    if (!temp.open()) {
        return fail(TransferError(ErrorKind::LocalIO, TransferPhase::Receive,
                                  QStringLiteral("Cannot create temporary file in %1: %2")
                                      .arg(root.absolutePath(), temp.errorString())));
    }

    status(StatusLevel::Info, i18n("Receiving %1 (%2)", manifest.name, formatSize(manifest.size)));
    ProgressThrottle progress(m_observer, manifest.size, m_config.progressIntervalMs);
    progress.update(0);
    qint64 received = 0;
    TransferError error;
    if (!receivePayload(socket, temp, manifest.size, progress, received, error)) {
        error.entryPath = manifest.name;
        return fail(error);
    }
    progress.finish();
    temp.close();

    VerifyResult result = VerifyResult::Skipped;
    if (!verifyReceived(temp.fileName(), manifest.name, manifest.hash, result)) {
        return fail(m_verifier.lastError());
    }

    QFile::setPermissions(temp.fileName(), publishedFilePermissions);
    temp.setAutoRemove(false);
    int osError = 0;
    if (!replaceFile(temp.fileName(), finalPath, osError)) {
        QFile::remove(temp.fileName());
        return fail(TransferError(classifyOsError(osError, ErrorKind::LocalIO), TransferPhase::Finalize,
                                  QStringLiteral("Cannot move received file to %1").arg(finalPath), osError));
    }

    if (!sendAck(socket, TOKEN_DONE, m_config.ackSendTimeoutMs)) {
        QFile::remove(finalPath);
        TransferError ackFailure = socket.lastError();
        ackFailure.phase = TransferPhase::Acknowledge;
        return fail(ackFailure);
    }

    if (result == VerifyResult::Mismatch) {
        status(StatusLevel::Warning, i18n("File received but integrity check failed: %1", finalPath));
    } else if (result == VerifyResult::Skipped) {
        status(StatusLevel::Warning, i18n("File received without verification: %1", finalPath));
    } else {
        status(StatusLevel::Success, i18n("File received: %1", finalPath));
    }
    if (m_observer) {
        m_observer->transferCompleted(manifest, finalPath);
    }
    return true;
}

// ---------------------------------------------------------------------------
// Directory
// ---------------------------------------------------------------------------

bool TransferReceiver::receiveDirectory(TransferSocket &socket, const TransferManifest &manifest)
{
    const QDir root(m_config.receivedDir);
    if (!QDir().mkpath(root.absolutePath())) {
        return fail(TransferError(ErrorKind::LocalIO, TransferPhase::Receive,
                                  QStringLiteral("Cannot create %1").arg(root.absolutePath())));
    }
    const QString finalPath = root.absoluteFilePath(manifest.name);

    const QStorageInfo storage(root.absolutePath());
    const qint64 available = storage.isValid() && storage.isReady() ? storage.bytesAvailable() : -1;
    if (available < 0) {
        qCWarning(LANXFER_LOG) << "Free space unknown for" << root.absolutePath();
        status(StatusLevel::Warning, i18n("Could not check free disk space, continuing"));
    } else if (!hasSufficientSpace(available, manifest.totalSize)) {
        if (!sendAck(socket, TOKEN_SPACE_ERROR, m_config.ackSendTimeoutMs)) {
            qCWarning(LANXFER_LOG) << "Could not deliver SPACE_ERROR:" << socket.lastError().detail;
        }
        return fail(TransferError(ErrorKind::DiskSpace, TransferPhase::Receive,
                                  QStringLiteral("Need %1 plus %2% margin, %3 available")
                                      .arg(formatSize(manifest.totalSize))
                                      .arg(LANXFER_SPACE_MARGIN_PERCENT)
                                      .arg(formatSize(available))));
    }

    QTemporaryDir staging(root.absoluteFilePath(QStringLiteral(".%1_XXXXXX").arg(manifest.name)));
    if (!staging.isValid()) {
        return fail(TransferError(ErrorKind::LocalIO, TransferPhase::Receive,
                                  QStringLiteral("Cannot create temporary directory in %1: %2")
                                      .arg(root.absolutePath(), staging.errorString())));
    }

    status(StatusLevel::Info, i18np("Receiving %2: %1 file (%3)", "Receiving %2: %1 files (%3)",
                                    manifest.totalFiles, manifest.name, formatSize(manifest.totalSize)));
    ProgressThrottle progress(m_observer, manifest.totalSize, m_config.progressIntervalMs);
    progress.update(0);
    qint64 receivedTotal = 0;
    QString lastSuccessful;
    int mismatches = 0;

    for (int i = 0; i < manifest.files.size(); ++i) {
        const FileEntry &entry = manifest.files.at(i);
        const QString target = staging.filePath(entry.path);

        auto withContext = [&](TransferError error) {
            error.entryPath = entry.path;
            error.filesCompleted = i;
            error.totalFiles = manifest.totalFiles;
            error.lastSuccessfulEntry = lastSuccessful;
            return error;
        };

        if (!QDir().mkpath(QFileInfo(target).absolutePath())) {
            return fail(withContext(TransferError(ErrorKind::LocalIO, TransferPhase::Receive,
                                                  QStringLiteral("Cannot create directory for %1").arg(entry.path))));
        }

        QFile out(target);
        if (!out.open(QIODevice::WriteOnly | QIODevice::Unbuffered)) {
            const int osError = errno;
            return fail(withContext(TransferError(classifyOsError(osError, ErrorKind::LocalIO), TransferPhase::Receive,
                                                  QStringLiteral("Cannot create %1: %2").arg(entry.path, out.errorString()),
                                                  osError)));
        }

        TransferError error;
        if (!receivePayload(socket, out, entry.size, progress, receivedTotal, error)) {
            // The stream ended inside this entry: the sender had fewer bytes than it declared
            if (error.kind == ErrorKind::ConnectionLost && error.bytesTransferred < error.bytesExpected) {
                const qint64 got = error.bytesTransferred;
                error = TransferError(ErrorKind::SizeMismatch, TransferPhase::Receive,
                                      QStringLiteral("%1 ended after %2 of %3 bytes").arg(entry.path).arg(got).arg(entry.size));
                error.bytesTransferred = got;
                error.bytesExpected = entry.size;
            }
            return fail(withContext(error));
        }
        out.close();

        if (!entry.hash.isEmpty()) {
            VerifyResult result = VerifyResult::Skipped;
            if (!verifyReceived(target, manifest.name + QLatin1Char('/') + entry.path, entry.hash, result)) {
                return fail(withContext(m_verifier.lastError()));
            }
            if (result == VerifyResult::Mismatch) {
                ++mismatches;
            }
        }

        if (!sendAck(socket, TOKEN_ACK2, m_config.ackSendTimeoutMs)) {
            TransferError ackFailure = socket.lastError();
            ackFailure.phase = TransferPhase::Acknowledge;
            return fail(withContext(ackFailure));
        }
        lastSuccessful = entry.path;
        qCDebug(LANXFER_LOG) << "Entry" << i + 1 << "of" << manifest.totalFiles << "stored:" << entry.path;
    }
    progress.finish();

    // Replace any previous copy only now that the new one is complete
    const QFileInfo existing(finalPath);
    if (existing.exists() || existing.isSymLink()) {
        const bool removed = existing.isDir() && !existing.isSymLink() ? QDir(finalPath).removeRecursively()
                                                                       : QFile::remove(finalPath);
        if (!removed) {
            return fail(TransferError(ErrorKind::LocalIO, TransferPhase::Finalize,
                                      QStringLiteral("Cannot replace existing %1").arg(finalPath)));
        }
    }

    QFile::setPermissions(staging.path(), publishedDirPermissions);
    staging.setAutoRemove(false);
    if (!QDir().rename(staging.path(), finalPath)) {
        staging.setAutoRemove(true);
        return fail(TransferError(ErrorKind::LocalIO, TransferPhase::Finalize,
                                  QStringLiteral("Cannot move received directory to %1").arg(finalPath)));
    }

    if (!sendAck(socket, TOKEN_DONE, m_config.ackSendTimeoutMs)) {
        // The directory is complete on disk; only the sender's confirmation is lost
        TransferError ackFailure = socket.lastError();
        ackFailure.phase = TransferPhase::Acknowledge;
        return fail(ackFailure);
    }

    if (mismatches > 0) {
        status(StatusLevel::Warning, i18np("Directory received with %1 integrity failure: %2",
                                           "Directory received with %1 integrity failures: %2",
                                           mismatches, finalPath));
    } else if (m_config.skipHashVerification) {
        status(StatusLevel::Warning, i18n("Directory received without verification: %1", finalPath));
    } else {
        status(StatusLevel::Success, i18n("Directory received: %1", finalPath));
    }
    if (m_observer) {
        m_observer->transferCompleted(manifest, finalPath);
    }
    return true;
}

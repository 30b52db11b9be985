/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef TRANSFER_ERROR_H
#define TRANSFER_ERROR_H

#include <QAbstractSocket>
#include <QByteArray>
#include <QString>

enum class ErrorKind {
    None,
    ConnectionRefused,
    HostUnreachable,
    Timeout,
    ConnectionLost,
    Network,
    Protocol,
    HashAlgorithmRejected,
    IntegrityFailure,
    SizeMismatch,
    DiskSpace,
    LocalIO,
    UnsupportedAlgorithm,
    AddressInUse,
    AddressNotAvailable,
};

enum class TransferPhase {
    None,
    Connect,
    Handshake,
    Send,
    Receive,
    Acknowledge,
    Finalize,
    Bind,
    Accept,
};

struct TransferError {
    ErrorKind kind = ErrorKind::None;
    TransferPhase phase = TransferPhase::None;
    int osError = 0;         // errno / WSA / Win32 code, 0 if unknown
    QString detail;

    // Directory context, filled when the failure concerns one entry
    QString entryPath;
    int filesCompleted = -1;
    int totalFiles = 0;
    QString lastSuccessfulEntry;

    // Byte context for payload failures
    qint64 bytesTransferred = -1;
    qint64 bytesExpected = -1;

    // Raw bytes of an unexpected acknowledgment
    QByteArray response;

    TransferError() = default;
    TransferError(ErrorKind k, TransferPhase p, const QString &d, int os = 0)
        : kind(k), phase(p), osError(os), detail(d)
    {
    }

    bool isError() const { return kind != ErrorKind::None; }

    // Localized, user-facing description including remedy hints
    QString toString() const;
};

QString errorKindName(ErrorKind kind);
QString phaseName(TransferPhase phase);

// Maps a small set of well-known OS conditions to the error taxonomy.
// Returns `fallback` for anything else.
ErrorKind classifyOsError(int osError, ErrorKind fallback = ErrorKind::Network);

ErrorKind classifySocketError(QAbstractSocket::SocketError error);

#endif // TRANSFER_ERROR_H

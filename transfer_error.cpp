/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "transfer_error.h"

#include <KLocalizedString>

#include <cerrno>

// ---------------------------------------------------------------------------
// Names (used in log output)
// ---------------------------------------------------------------------------

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:                  return QStringLiteral("none");
    case ErrorKind::ConnectionRefused:     return QStringLiteral("connection-refused");
    case ErrorKind::HostUnreachable:       return QStringLiteral("host-unreachable");
    case ErrorKind::Timeout:               return QStringLiteral("timeout");
    case ErrorKind::ConnectionLost:        return QStringLiteral("connection-lost");
    case ErrorKind::Network:               return QStringLiteral("network");
    case ErrorKind::Protocol:              return QStringLiteral("protocol");
    case ErrorKind::HashAlgorithmRejected: return QStringLiteral("hash-algorithm-rejected");
    case ErrorKind::IntegrityFailure:      return QStringLiteral("integrity-failure");
    case ErrorKind::SizeMismatch:          return QStringLiteral("size-mismatch");
    case ErrorKind::DiskSpace:             return QStringLiteral("disk-space");
    case ErrorKind::LocalIO:               return QStringLiteral("local-io");
    case ErrorKind::UnsupportedAlgorithm:  return QStringLiteral("unsupported-algorithm");
    case ErrorKind::AddressInUse:          return QStringLiteral("address-in-use");
    case ErrorKind::AddressNotAvailable:   return QStringLiteral("address-not-available");
    }
    return QStringLiteral("unknown");
}

QString phaseName(TransferPhase phase)
{
    switch (phase) {
    case TransferPhase::None:        return QStringLiteral("none");
    case TransferPhase::Connect:     return QStringLiteral("connect");
    case TransferPhase::Handshake:   return QStringLiteral("handshake");
    case TransferPhase::Send:        return QStringLiteral("send");
    case TransferPhase::Receive:     return QStringLiteral("receive");
    case TransferPhase::Acknowledge: return QStringLiteral("acknowledge");
    case TransferPhase::Finalize:    return QStringLiteral("finalize");
    case TransferPhase::Bind:        return QStringLiteral("bind");
    case TransferPhase::Accept:      return QStringLiteral("accept");
    }
    return QStringLiteral("unknown");
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

ErrorKind classifyOsError(int osError, ErrorKind fallback)
{
    switch (osError) {
    case ECONNRESET:
    case EPIPE:
        return ErrorKind::ConnectionLost;
    case ECONNREFUSED:
        return ErrorKind::ConnectionRefused;
    case EHOSTUNREACH:
    case ENETUNREACH:
        return ErrorKind::HostUnreachable;
    case ETIMEDOUT:
        return ErrorKind::Timeout;
    case EADDRINUSE:
        return ErrorKind::AddressInUse;
    case EADDRNOTAVAIL:
        return ErrorKind::AddressNotAvailable;
    case ENOSPC:
#ifdef EDQUOT
    case EDQUOT:
#endif
        return ErrorKind::DiskSpace;
#ifdef Q_OS_WIN
    case 10054: // WSAECONNRESET
        return ErrorKind::ConnectionLost;
    case 10061: // WSAECONNREFUSED
        return ErrorKind::ConnectionRefused;
    case 10060: // WSAETIMEDOUT
        return ErrorKind::Timeout;
    case 10048: // WSAEADDRINUSE
        return ErrorKind::AddressInUse;
    case 10049: // WSAEADDRNOTAVAIL
        return ErrorKind::AddressNotAvailable;
    case 112:   // ERROR_DISK_FULL
        return ErrorKind::DiskSpace;
#endif
    default:
        return fallback;
    }
}

ErrorKind classifySocketError(QAbstractSocket::SocketError error)
{
    switch (error) {
    case QAbstractSocket::ConnectionRefusedError:
        return ErrorKind::ConnectionRefused;
    case QAbstractSocket::HostNotFoundError:
    case QAbstractSocket::NetworkError:
        return ErrorKind::HostUnreachable;
    case QAbstractSocket::RemoteHostClosedError:
        return ErrorKind::ConnectionLost;
    case QAbstractSocket::SocketTimeoutError:
        return ErrorKind::Timeout;
    case QAbstractSocket::AddressInUseError:
        return ErrorKind::AddressInUse;
    case QAbstractSocket::SocketAddressNotAvailableError:
        return ErrorKind::AddressNotAvailable;
    default:
        return ErrorKind::Network;
    }
}

// ---------------------------------------------------------------------------
// User-facing text
// ---------------------------------------------------------------------------

QString TransferError::toString() const
{
    QString text;

    switch (kind) {
    case ErrorKind::None:
        return QString();
    case ErrorKind::ConnectionRefused:
        text = i18n("Connection refused: the receiver might not be running (%1)", detail);
        break;
    case ErrorKind::HostUnreachable:
        text = i18n("Host unreachable: %1", detail);
        break;
    case ErrorKind::Timeout:
        text = i18n("Timeout during %1: %2", phaseName(phase), detail);
        break;
    case ErrorKind::ConnectionLost:
        text = i18n("Connection lost: %1", detail);
        break;
    case ErrorKind::Network:
        text = i18n("Network error (code %1): %2", osError, detail);
        break;
    case ErrorKind::Protocol:
        text = i18n("Protocol error: %1", detail);
        break;
    case ErrorKind::HashAlgorithmRejected:
        text = i18n("Hash algorithm mismatch: %1. Use the same hash algorithm on both sides, "
                    "or enable SKIP_HASH_VERIFICATION on the receiver.", detail);
        break;
    case ErrorKind::IntegrityFailure:
        text = i18n("Integrity check failed: %1", detail);
        break;
    case ErrorKind::SizeMismatch:
        text = i18n("Size mismatch: %1", detail);
        break;
    case ErrorKind::DiskSpace:
        text = i18n("Not enough disk space: %1", detail);
        break;
    case ErrorKind::LocalIO:
        text = i18n("File access error: %1", detail);
        break;
    case ErrorKind::UnsupportedAlgorithm:
        text = i18n("Unsupported hash algorithm: %1", detail);
        break;
    case ErrorKind::AddressInUse:
        text = i18n("%1 is already in use. Try a different port or close other "
                    "applications using this port.", detail);
        break;
    case ErrorKind::AddressNotAvailable:
        text = i18n("Cannot bind to %1. Check that the IP address is correct and available.", detail);
        break;
    }

    if (!entryPath.isEmpty() && filesCompleted >= 0) {
        text += QLatin1Char(' ')
              + i18n("(file %1, completed %2/%3 files, last successful: %4)",
                     entryPath, filesCompleted, totalFiles,
                     lastSuccessfulEntry.isEmpty() ? i18n("none") : lastSuccessfulEntry);
    } else if (!entryPath.isEmpty()) {
        text += QLatin1Char(' ') + i18n("(file %1)", entryPath);
    }
    return text;
}

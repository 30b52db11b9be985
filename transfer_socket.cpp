/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "transfer_socket.h"
#include "lanxfer_debug.h"

TransferSocket::TransferSocket(int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
}

TransferSocket::~TransferSocket()
{
    close();
}

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

bool TransferSocket::connectToHost(const QHostAddress &target, quint16 port,
                                   const QHostAddress &local)
{
    m_lastError = TransferError();

    if (!local.isNull() && !m_socket.bind(local)) {
        m_lastError = TransferError(classifySocketError(m_socket.error()), TransferPhase::Connect,
                                    QStringLiteral("Cannot bind to %1: %2")
                                        .arg(local.toString(), m_socket.errorString()));
        return false;
    }

    m_socket.connectToHost(target, port);
    if (!m_socket.waitForConnected(m_timeoutMs)) {
        m_lastError = TransferError(classifySocketError(m_socket.error()), TransferPhase::Connect,
                                    QStringLiteral("Connection to %1:%2 failed: %3")
                                        .arg(target.toString())
                                        .arg(port)
                                        .arg(m_socket.errorString()));
        m_socket.abort();
        return false;
    }

    m_peer = QStringLiteral("%1:%2").arg(m_socket.peerAddress().toString()).arg(m_socket.peerPort());
    qCDebug(LANXFER_LOG) << "Connected to" << m_peer;
    return true;
}

bool TransferSocket::adoptDescriptor(qintptr descriptor)
{
    m_lastError = TransferError();
    if (!m_socket.setSocketDescriptor(descriptor)) {
        m_lastError = TransferError(ErrorKind::Network, TransferPhase::Accept,
                                    QStringLiteral("Cannot adopt socket %1: %2")
                                        .arg(descriptor)
                                        .arg(m_socket.errorString()));
        return false;
    }
    m_peer = QStringLiteral("%1:%2").arg(m_socket.peerAddress().toString()).arg(m_socket.peerPort());
    return true;
}

void TransferSocket::close()
{
    if (m_socket.state() != QAbstractSocket::UnconnectedState) {
        m_socket.disconnectFromHost();
        if (m_socket.state() != QAbstractSocket::UnconnectedState) {
            m_socket.waitForDisconnected(3000);
        }
    }
}

void TransferSocket::abort()
{
    m_socket.abort();
}

bool TransferSocket::isConnected() const
{
    return m_socket.state() == QAbstractSocket::ConnectedState;
}

void TransferSocket::setSocketError(TransferPhase phase)
{
    m_lastError = TransferError(classifySocketError(m_socket.error()), phase, m_socket.errorString());
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

qint64 TransferSocket::readSome(char *buf, qint64 maxLen)
{
    if (m_socket.bytesAvailable() == 0 && !m_socket.waitForReadyRead(m_timeoutMs)) {
        // Data may have arrived together with the close
        if (m_socket.bytesAvailable() == 0) {
            if (m_socket.state() != QAbstractSocket::ConnectedState) {
                return 0;
            }
            if (m_socket.error() == QAbstractSocket::SocketTimeoutError) {
                m_lastError = TransferError(ErrorKind::Timeout, TransferPhase::Receive,
                                            QStringLiteral("No data for %1 ms").arg(m_timeoutMs));
            } else {
                setSocketError(TransferPhase::Receive);
            }
            return -1;
        }
    }

    const qint64 n = m_socket.read(buf, maxLen);
    if (n < 0) {
        setSocketError(TransferPhase::Receive);
        return -1;
    }
    return n;
}

bool TransferSocket::readExact(char *buf, qint64 len)
{
    qint64 bytesRead = 0;
    while (bytesRead < len) {
        const qint64 n = readSome(buf + bytesRead, len - bytesRead);
        if (n < 0) {
            m_lastError.bytesTransferred = bytesRead;
            m_lastError.bytesExpected = len;
            return false;
        }
        if (n == 0) {
            m_lastError = TransferError(ErrorKind::ConnectionLost, TransferPhase::Receive,
                                        QStringLiteral("Connection closed after %1/%2 bytes")
                                            .arg(bytesRead)
                                            .arg(len));
            m_lastError.bytesTransferred = bytesRead;
            m_lastError.bytesExpected = len;
            return false;
        }
        bytesRead += n;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

bool TransferSocket::writeAll(const char *data, qint64 len)
{
    qint64 written = 0;
    while (written < len) {
        const qint64 n = m_socket.write(data + written, len - written);
        if (n < 0) {
            setSocketError(TransferPhase::Send);
            return false;
        }
        written += n;
    }

    while (m_socket.bytesToWrite() > 0) {
        if (!m_socket.waitForBytesWritten(m_timeoutMs)) {
            if (m_socket.state() != QAbstractSocket::ConnectedState) {
                m_lastError = TransferError(ErrorKind::ConnectionLost, TransferPhase::Send,
                                            m_socket.errorString());
            } else if (m_socket.error() == QAbstractSocket::SocketTimeoutError) {
                m_lastError = TransferError(ErrorKind::Timeout, TransferPhase::Send,
                                            QStringLiteral("Peer not reading for %1 ms").arg(m_timeoutMs));
            } else {
                setSocketError(TransferPhase::Send);
            }
            return false;
        }
    }
    return true;
}

bool TransferSocket::probeLiveness()
{
    if (m_socket.state() == QAbstractSocket::ConnectedState && m_socket.bytesToWrite() > 0) {
        m_socket.flush();
    }

    // Lets the socket engine notice a reset or an orderly close without
    // blocking; anything the peer sent stays buffered for the next read.
    if (m_socket.state() == QAbstractSocket::ConnectedState) {
        m_socket.waitForReadyRead(0);
    }

    if (m_socket.state() != QAbstractSocket::ConnectedState) {
        m_lastError = TransferError(ErrorKind::ConnectionLost, TransferPhase::Send,
                                    QStringLiteral("Peer %1 went away").arg(m_peer));
        return false;
    }
    return true;
}

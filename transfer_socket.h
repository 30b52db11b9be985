/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef TRANSFER_SOCKET_H
#define TRANSFER_SOCKET_H

#include <QHostAddress>
#include <QTcpSocket>

#include "transfer_error.h"

// Blocking TCP connection used by both engines. Every blocking call waits at
// most timeout() milliseconds; failures are classified into TransferError.
// Must be used from the thread that created it.
class TransferSocket
{
public:
    explicit TransferSocket(int timeoutMs);
    ~TransferSocket();

    TransferSocket(const TransferSocket &) = delete;
    TransferSocket &operator=(const TransferSocket &) = delete;

    // Connection management
    bool connectToHost(const QHostAddress &target, quint16 port,
                       const QHostAddress &local = QHostAddress());
    bool adoptDescriptor(qintptr descriptor);
    void close();
    void abort();

    bool isConnected() const;
    QString peerDescription() const { return m_peer; }

    int timeout() const { return m_timeoutMs; }
    void setTimeout(int timeoutMs) { m_timeoutMs = timeoutMs; }

    // Reads at least one byte, at most `maxLen`. Returns 0 when the peer
    // closed the connection, -1 on timeout or error (see lastError()).
    qint64 readSome(char *buf, qint64 maxLen);
    bool readExact(char *buf, qint64 len);

    bool writeAll(const char *data, qint64 len);
    bool writeAll(const QByteArray &data) { return writeAll(data.constData(), data.size()); }

    // Zero-length write: flushes pending output and confirms the peer has not
    // gone away. Cheap enough to call every few chunks.
    bool probeLiveness();

    QTcpSocket &socket() { return m_socket; }
    TransferError lastError() const { return m_lastError; }
    void setLastError(const TransferError &error) { m_lastError = error; }

private:
    QTcpSocket m_socket;
    int m_timeoutMs;
    QString m_peer;
    TransferError m_lastError;

    void setSocketError(TransferPhase phase);
};

// Overrides the socket timeout for one scope and restores the previous value
class ScopedTimeout
{
public:
    ScopedTimeout(TransferSocket &socket, int timeoutMs)
        : m_socket(socket)
        , m_previous(socket.timeout())
    {
        m_socket.setTimeout(timeoutMs);
    }
    ~ScopedTimeout() { m_socket.setTimeout(m_previous); }

    ScopedTimeout(const ScopedTimeout &) = delete;
    ScopedTimeout &operator=(const ScopedTimeout &) = delete;

private:
    TransferSocket &m_socket;
    int m_previous;
};

#endif // TRANSFER_SOCKET_H

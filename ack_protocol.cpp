/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "ack_protocol.h"
#include "lanxfer_config.h"
#include "lanxfer_debug.h"
#include "transfer_socket.h"

#include <QElapsedTimer>

// ---------------------------------------------------------------------------
// Reading a token
//
// The peer's bytes are peeked first; only the matched token is consumed.
// A buffer that is still a proper prefix of an accepted token (a token split
// across TCP segments) waits for more data within the same deadline.
// ---------------------------------------------------------------------------

AckResult awaitAck(TransferSocket &socket, const QList<QByteArray> &accepted, int timeoutMs)
{
    ScopedTimeout scope(socket, timeoutMs);
    QTcpSocket &sock = socket.socket();

    int maxLength = 0;
    for (const QByteArray &token : accepted) {
        maxLength = qMax(maxLength, token.size());
    }
    maxLength = qMin(maxLength, LANXFER_MAX_ACK_LENGTH);

    AckResult result;
    QElapsedTimer timer;
    timer.start();

    while (true) {
        const QByteArray pending = sock.peek(maxLength);
        if (!pending.isEmpty()) {
            for (const QByteArray &token : accepted) {
                if (pending.startsWith(token)) {
                    sock.read(token.size());
                    qCDebug(LANXFER_LOG) << "<<" << token;
                    result.status = AckStatus::Matched;
                    result.token = token;
                    return result;
                }
            }

            bool partial = false;
            if (pending.size() < maxLength) {
                for (const QByteArray &token : accepted) {
                    if (token.startsWith(pending)) {
                        partial = true;
                        break;
                    }
                }
            }
            if (!partial) {
                result.status = AckStatus::UnexpectedResponse;
                result.raw = sock.read(pending.size());
                qCWarning(LANXFER_LOG) << "Unexpected response" << result.raw
                                       << "expected one of" << accepted;
                return result;
            }
        }

        const qint64 remaining = socket.timeout() - timer.elapsed();
        if (remaining <= 0) {
            result.status = AckStatus::Timeout;
            result.raw = pending;
            return result;
        }

        if (!sock.waitForReadyRead(static_cast<int>(remaining))) {
            if (sock.bytesAvailable() > pending.size()) {
                continue;
            }
            if (sock.state() != QAbstractSocket::ConnectedState) {
                result.status = pending.isEmpty() ? AckStatus::ConnectionLost
                                                  : AckStatus::UnexpectedResponse;
                result.raw = sock.read(pending.size());
            } else if (sock.error() == QAbstractSocket::SocketTimeoutError) {
                result.status = AckStatus::Timeout;
                result.raw = pending;
            } else {
                result.status = AckStatus::NetworkError;
                result.raw = sock.errorString().toUtf8();
            }
            return result;
        }
    }
}

// ---------------------------------------------------------------------------
// Writing a token
// ---------------------------------------------------------------------------

bool sendAck(TransferSocket &socket, const char *token, int timeoutMs)
{
    ScopedTimeout scope(socket, timeoutMs);
    qCDebug(LANXFER_LOG) << ">>" << token;
    return socket.writeAll(QByteArray(token));
}

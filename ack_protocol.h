/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef ACK_PROTOCOL_H
#define ACK_PROTOCOL_H

#include <QByteArray>
#include <QList>

class TransferSocket;

// Control tokens, sent as raw ASCII and matched by prefix
constexpr char TOKEN_ACK1[] = "ACK1";               // manifest accepted
constexpr char TOKEN_MISMATCH[] = "MISMATCH";       // hash algorithm rejected
constexpr char TOKEN_ACK2[] = "ACK2";               // one directory entry stored
constexpr char TOKEN_DONE[] = "DONE";               // transfer complete
constexpr char TOKEN_SPACE_ERROR[] = "SPACE_ERROR"; // not enough disk space

enum class AckStatus {
    Matched,
    Timeout,
    UnexpectedResponse,
    ConnectionLost,
    NetworkError,
};

struct AckResult {
    AckStatus status = AckStatus::Timeout;
    QByteArray token;   // the matched token
    QByteArray raw;     // bytes read when nothing matched
};

// Waits up to `timeoutMs` for one of `accepted`. Reads no further than the
// matched token, so a token the peer sent right after stays buffered.
// The socket timeout is overridden for the call and restored afterwards.
AckResult awaitAck(TransferSocket &socket, const QList<QByteArray> &accepted, int timeoutMs);

// Writes `token` and waits up to `timeoutMs` for it to leave the buffer
bool sendAck(TransferSocket &socket, const char *token, int timeoutMs);

#endif // ACK_PROTOCOL_H

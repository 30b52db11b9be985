/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef TRANSFER_SENDER_H
#define TRANSFER_SENDER_H

#include <QHostAddress>
#include <QString>

#include "lanxfer_config.h"
#include "manifest.h"
#include "transfer_error.h"
#include "transfer_observer.h"

class TransferSocket;

// Synchronous sending side. Each call opens one connection, performs one
// transfer and closes it; nothing is retried.
class TransferSender
{
public:
    explicit TransferSender(const TransferConfig &config, TransferObserver *observer = nullptr);

    // `target` is the receiver, reached on config.port. A non-null `local`
    // binds the outgoing connection to that interface address.
    bool sendFile(const QString &path, const QHostAddress &target,
                  const QHostAddress &local = QHostAddress());
    bool sendDirectory(const QString &path, const QHostAddress &target,
                       const QHostAddress &local = QHostAddress());

    TransferError lastError() const { return m_lastError; }

private:
    TransferConfig m_config;
    TransferObserver *m_observer;
    TransferError m_lastError;

    // Connect, send the manifest, wait for ACK1 / MISMATCH
    bool negotiate(TransferSocket &socket, const TransferManifest &manifest,
                   const QHostAddress &target, const QHostAddress &local);

    // Streams exactly `declaredSize` bytes of `sourcePath`. A non-zero
    // `probeInterval` runs a liveness probe every that many chunks.
    bool streamFile(TransferSocket &socket, const QString &sourcePath, qint64 declaredSize,
                    int probeInterval, ProgressThrottle &progress, qint64 &sentTotal,
                    TransferError &error);

    bool fail(const TransferError &error);
    void status(StatusLevel level, const QString &message);
};

#endif // TRANSFER_SENDER_H

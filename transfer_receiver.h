/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef TRANSFER_RECEIVER_H
#define TRANSFER_RECEIVER_H

#include <QFileDevice>
#include <QString>

#include <vector>

#include "integrity.h"
#include "lanxfer_config.h"
#include "manifest.h"
#include "transfer_error.h"
#include "transfer_observer.h"

class TransferSocket;

// Free space must be strictly more than the declared size plus the margin
bool hasSufficientSpace(qint64 available, qint64 required);

// Receive side of one accepted connection. Staging artifacts are created
// next to the destination and only ever renamed into place once complete.
class TransferReceiver
{
public:
    TransferReceiver(const TransferConfig &config, ValidationLog *validations,
                     TransferObserver *observer = nullptr);

    // Runs the whole exchange: manifest, negotiation, payload, publication.
    bool handleConnection(TransferSocket &socket);

    TransferError lastError() const { return m_lastError; }

private:
    TransferConfig m_config;
    ValidationLog *m_validations;
    TransferObserver *m_observer;
    IntegrityVerifier m_verifier;
    TransferError m_lastError;
    std::vector<char> m_buffer;

    bool readManifest(TransferSocket &socket, TransferManifest &manifest);
    bool checkManifest(const TransferManifest &manifest);
    bool negotiate(TransferSocket &socket, const TransferManifest &manifest);

    bool receiveFile(TransferSocket &socket, const TransferManifest &manifest);
    bool receiveDirectory(TransferSocket &socket, const TransferManifest &manifest);

    // Copies exactly `size` payload bytes from the socket into `out`
    bool receivePayload(TransferSocket &socket, QFileDevice &out, qint64 size,
                        ProgressThrottle &progress, qint64 &receivedTotal, TransferError &error);

    // Returns false only if the file could not be hashed
    bool verifyReceived(const QString &stagedPath, const QString &reportedPath,
                        const QString &expectedHash, VerifyResult &result);

    bool fail(const TransferError &error);
    void status(StatusLevel level, const QString &message);
};

#endif // TRANSFER_RECEIVER_H

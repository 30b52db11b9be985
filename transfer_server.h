/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef TRANSFER_SERVER_H
#define TRANSFER_SERVER_H

#include <QHostAddress>
#include <QList>
#include <QMutex>
#include <QThread>
#include <QThreadPool>
#include <QWaitCondition>

#include <memory>

#include "integrity.h"
#include "lanxfer_config.h"
#include "transfer_error.h"

class TransferObserver;

// Single-fire event: set() once, wait() with a timeout, reset() before reuse
class ReadySignal
{
public:
    void set();
    void reset();
    bool wait(int timeoutMs);

private:
    QMutex m_mutex;
    QWaitCondition m_condition;
    bool m_set = false;
};

// Accepts connections on a dedicated thread and hands each one to a
// TransferReceiver running on the handler pool. Handlers are never awaited
// by the accept loop and are not cancelled by stop().
class TransferServer
{
public:
    explicit TransferServer(const TransferConfig &config, TransferObserver *observer = nullptr);
    ~TransferServer();

    TransferServer(const TransferServer &) = delete;
    TransferServer &operator=(const TransferServer &) = delete;

    // Blocks until the socket is listening or startup failed. Port 0 picks
    // a free port, see serverPort().
    bool start(const QHostAddress &address, quint16 port);
    bool start(const QHostAddress &address = QHostAddress::Any) { return start(address, m_config.port); }

    // Stops accepting; in-flight transfers run to completion. Idempotent.
    void stop();

    bool isRunning() const;
    quint16 serverPort() const;
    TransferError lastError() const;

    // Waits for handlers that are still running, -1 waits forever
    bool waitForHandlers(int timeoutMs = -1);

    // Integrity failures not yet reported through validationSummary()
    QList<FailedValidation> takeFailedValidations();

private:
    struct ServerState {
        bool running = false;
        bool stopRequested = false;
        quint16 port = 0;
        TransferError error;
    };

    TransferConfig m_config;
    TransferObserver *m_observer;

    mutable QMutex m_stateMutex;
    ServerState m_state;

    ReadySignal m_ready;
    std::unique_ptr<QThread> m_thread;
    QThreadPool m_handlers;
    ValidationLog m_validations;

    void serve(const QHostAddress &address, quint16 port);
    void dispatch(qintptr descriptor);
};

#endif // TRANSFER_SERVER_H

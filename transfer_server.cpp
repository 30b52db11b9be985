/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "transfer_server.h"
#include "lanxfer_debug.h"
#include "transfer_observer.h"
#include "transfer_receiver.h"
#include "transfer_socket.h"

#include <QDeadlineTimer>
#include <QMutexLocker>
#include <QRunnable>
#include <QTcpServer>

#include <KLocalizedString>

#include <limits>

#ifdef Q_OS_WIN
#include <winsock2.h>
#else
#include <unistd.h>
#endif

namespace {

// Queues accepted descriptors instead of wrapping them in QTcpSockets, so
// each handler can create its socket in its own thread.
class ListeningSocket : public QTcpServer
{
public:
    QList<qintptr> takeAccepted()
    {
        QList<qintptr> accepted;
        accepted.swap(m_accepted);
        return accepted;
    }

protected:
    void incomingConnection(qintptr descriptor) override
    {
        m_accepted.append(descriptor);
    }

private:
    QList<qintptr> m_accepted;
};

class ConnectionHandler : public QRunnable
{
public:
    ConnectionHandler(qintptr descriptor, const TransferConfig &config, ValidationLog *validations,
                      TransferObserver *observer)
        : m_descriptor(descriptor)
        , m_config(config)
        , m_validations(validations)
        , m_observer(observer)
    {
    }

    void run() override
    {
        TransferSocket socket(m_config.ioTimeoutMs);
        if (!socket.adoptDescriptor(m_descriptor)) {
            qCWarning(LANXFER_LOG) << socket.lastError().detail;
#ifdef Q_OS_WIN
            ::closesocket(static_cast<SOCKET>(m_descriptor));
#else
            ::close(static_cast<int>(m_descriptor));
#endif
            return;
        }
        qCDebug(LANXFER_LOG) << "Handling connection from" << socket.peerDescription();

        TransferReceiver receiver(m_config, m_validations, m_observer);
        receiver.handleConnection(socket);
    }

private:
    qintptr m_descriptor;
    TransferConfig m_config;
    ValidationLog *m_validations;
    TransferObserver *m_observer;
};

} // namespace

// ---------------------------------------------------------------------------
// ReadySignal
// ---------------------------------------------------------------------------

void ReadySignal::set()
{
    QMutexLocker locker(&m_mutex);
    m_set = true;
    m_condition.wakeAll();
}

void ReadySignal::reset()
{
    QMutexLocker locker(&m_mutex);
    m_set = false;
}

bool ReadySignal::wait(int timeoutMs)
{
    QDeadlineTimer deadline(timeoutMs);
    QMutexLocker locker(&m_mutex);
    while (!m_set) {
        if (!m_condition.wait(&m_mutex, deadline)) {
            return m_set;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// TransferServer
// ---------------------------------------------------------------------------

TransferServer::TransferServer(const TransferConfig &config, TransferObserver *observer)
    : m_config(config)
    , m_observer(observer)
{
    m_handlers.setMaxThreadCount(config.maxConcurrentHandlers > 0 ? config.maxConcurrentHandlers
                                                                  : std::numeric_limits<int>::max());
}

TransferServer::~TransferServer()
{
    stop();
    m_handlers.waitForDone();
}

bool TransferServer::isRunning() const
{
    QMutexLocker locker(&m_stateMutex);
    return m_state.running;
}

quint16 TransferServer::serverPort() const
{
    QMutexLocker locker(&m_stateMutex);
    return m_state.port;
}

TransferError TransferServer::lastError() const
{
    QMutexLocker locker(&m_stateMutex);
    return m_state.error;
}

bool TransferServer::start(const QHostAddress &address, quint16 port)
{
    if (isRunning()) {
        qCWarning(LANXFER_LOG) << "Server already running on port" << serverPort();
        return false;
    }
    if (m_thread) {
        m_thread->wait();
        m_thread.reset();
    }

    {
        QMutexLocker locker(&m_stateMutex);
        m_state = ServerState();
    }
    m_ready.reset();

    m_thread.reset(QThread::create([this, address, port] {
        serve(address, port);
    }));
    m_thread->start();

    // A failed bind never signals readiness; stop waiting once the thread is gone
    const QDeadlineTimer deadline(m_config.startupTimeoutMs);
    while (!deadline.hasExpired() && !m_thread->isFinished()) {
        if (m_ready.wait(static_cast<int>(qMin<qint64>(50, deadline.remainingTime())))) {
            return true;
        }
    }
    if (m_ready.wait(0)) {
        return true;
    }

    // Either the bind failed or the thread is too slow; make sure a late
    // bind does not leave a server nobody knows about.
    {
        QMutexLocker locker(&m_stateMutex);
        m_state.running = false;
        m_state.stopRequested = true;
        if (!m_state.error.isError()) {
            m_state.error = TransferError(ErrorKind::Timeout, TransferPhase::Bind,
                                          QStringLiteral("Server did not start within %1 ms")
                                              .arg(m_config.startupTimeoutMs));
        }
    }
    m_thread->wait();
    m_thread.reset();
    return false;
}

void TransferServer::stop()
{
    {
        QMutexLocker locker(&m_stateMutex);
        m_state.running = false;
        m_state.stopRequested = true;
    }
    if (m_thread) {
        m_thread->wait();
        m_thread.reset();
    }
}

bool TransferServer::waitForHandlers(int timeoutMs)
{
    return m_handlers.waitForDone(timeoutMs);
}

QList<FailedValidation> TransferServer::takeFailedValidations()
{
    return m_validations.drain();
}

void TransferServer::dispatch(qintptr descriptor)
{
    m_handlers.start(new ConnectionHandler(descriptor, m_config, &m_validations, m_observer));
}

void TransferServer::serve(const QHostAddress &address, quint16 port)
{
    ListeningSocket listener;
    if (!listener.listen(address, port)) {
        ErrorKind kind = classifySocketError(listener.serverError());
        if (kind != ErrorKind::AddressInUse && kind != ErrorKind::AddressNotAvailable) {
            kind = ErrorKind::Network;
        }
        const TransferError error(kind, TransferPhase::Bind,
                                  QStringLiteral("Cannot listen on %1:%2: %3")
                                      .arg(address.toString())
                                      .arg(port)
                                      .arg(listener.errorString()));
        {
            QMutexLocker locker(&m_stateMutex);
            m_state.running = false;
            m_state.error = error;
        }
        qCWarning(LANXFER_LOG) << error.detail;
        if (m_observer) {
            m_observer->statusMessage(StatusLevel::Error, error.toString());
        }
        return;
    }

    {
        QMutexLocker locker(&m_stateMutex);
        if (m_state.stopRequested) {
            return;
        }
        m_state.running = true;
        m_state.port = listener.serverPort();
    }
    qCInfo(LANXFER_LOG) << "Listening on" << address.toString() << listener.serverPort();
    if (m_observer) {
        m_observer->statusMessage(StatusLevel::Info, i18n("Listening on %1:%2", address.toString(),
                                                          listener.serverPort()));
    }
    m_ready.set();

    while (isRunning()) {
        bool timedOut = false;
        if (!listener.waitForNewConnection(m_config.serverTimeoutMs, &timedOut)) {
            if (timedOut) {
                continue;
            }
            if (isRunning()) {
                qCWarning(LANXFER_LOG) << "Accept failed:" << listener.errorString();
                if (m_observer) {
                    m_observer->statusMessage(StatusLevel::Error, i18n("Server error: %1", listener.errorString()));
                }
            }
            break;
        }
        const QList<qintptr> accepted = listener.takeAccepted();
        for (qintptr descriptor : accepted) {
            dispatch(descriptor);
        }
    }

    listener.close();
    {
        QMutexLocker locker(&m_stateMutex);
        m_state.running = false;
    }
    qCInfo(LANXFER_LOG) << "Server stopped";

    const QList<FailedValidation> failures = m_validations.drain();
    if (m_observer) {
        m_observer->statusMessage(StatusLevel::Info, i18n("Server stopped"));
        if (!failures.isEmpty()) {
            m_observer->validationSummary(failures);
        }
    }
}

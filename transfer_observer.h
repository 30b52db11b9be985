/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef TRANSFER_OBSERVER_H
#define TRANSFER_OBSERVER_H

#include <QElapsedTimer>
#include <QList>
#include <QString>

#include "integrity.h"
#include "manifest.h"
#include "transfer_error.h"

enum class StatusLevel {
    Info,
    Success,
    Warning,
    Error,
};

// Hooks for whatever renders the transfer. Receiver callbacks arrive on
// connection handler threads, possibly several at once, so implementations
// must be thread-safe.
class TransferObserver
{
public:
    virtual ~TransferObserver() = default;

    virtual void transferProgress(qint64 done, qint64 total) = 0;
    virtual void statusMessage(StatusLevel level, const QString &message) = 0;

    virtual void transferStarted(const TransferManifest &manifest, const QString &peer)
    {
        Q_UNUSED(manifest);
        Q_UNUSED(peer);
    }
    virtual void transferCompleted(const TransferManifest &manifest, const QString &destination)
    {
        Q_UNUSED(manifest);
        Q_UNUSED(destination);
    }
    virtual void transferFailed(const TransferError &error)
    {
        Q_UNUSED(error);
    }
    virtual void integrityFailure(const FailedValidation &failure)
    {
        Q_UNUSED(failure);
    }
    virtual void validationSummary(const QList<FailedValidation> &failures)
    {
        Q_UNUSED(failures);
    }
};

// Coalesces progress updates to one call per interval. The first and the
// final value are always delivered.
class ProgressThrottle
{
public:
    ProgressThrottle(TransferObserver *observer, qint64 total, int intervalMs);

    void update(qint64 done);
    void finish();

private:
    TransferObserver *m_observer;
    qint64 m_total;
    int m_intervalMs;
    qint64 m_done = 0;
    qint64 m_reported = -1;
    QElapsedTimer m_timer;
};

// "0 B", "512.0 B", "1.5 MB", ...
QString formatSize(qint64 size);

#endif // TRANSFER_OBSERVER_H

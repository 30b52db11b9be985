/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef TEST_OBSERVER_H
#define TEST_OBSERVER_H

#include <QList>
#include <QMutex>
#include <QStringList>
#include <QWaitCondition>

#include "transfer_observer.h"

// Records every callback; handler threads report here while the test thread
// waits for the receiving side to finish.
class RecordingObserver : public TransferObserver
{
public:
    void transferProgress(qint64 done, qint64 total) override;
    void statusMessage(StatusLevel level, const QString &message) override;
    void transferStarted(const TransferManifest &manifest, const QString &peer) override;
    void transferCompleted(const TransferManifest &manifest, const QString &destination) override;
    void transferFailed(const TransferError &error) override;
    void integrityFailure(const FailedValidation &failure) override;
    void validationSummary(const QList<FailedValidation> &failures) override;

    // Blocks until `count` transfers have completed or failed
    bool waitForFinished(int count, int timeoutMs = 15000);

    QList<TransferError> failures() const;
    QStringList completed() const;
    QList<FailedValidation> integrityFailures() const;
    QList<FailedValidation> summary() const;
    QList<QPair<qint64, qint64>> progress() const;
    QList<QPair<StatusLevel, QString>> statuses() const;

private:
    mutable QMutex m_mutex;
    QWaitCondition m_finished;
    int m_finishedCount = 0;
    QList<TransferError> m_failures;
    QStringList m_completed;
    QList<FailedValidation> m_integrityFailures;
    QList<FailedValidation> m_summary;
    QList<QPair<qint64, qint64>> m_progress;
    QList<QPair<StatusLevel, QString>> m_statuses;
};

#endif // TEST_OBSERVER_H

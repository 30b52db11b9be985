/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef CONSOLE_OBSERVER_H
#define CONSOLE_OBSERVER_H

#include <QMutex>
#include <QTextStream>

#include "transfer_observer.h"

// Terminal rendering for the command-line tool: one redrawn progress line
// plus status lines, all on stderr.
class ConsoleObserver : public TransferObserver
{
public:
    ConsoleObserver();

    void transferProgress(qint64 done, qint64 total) override;
    void statusMessage(StatusLevel level, const QString &message) override;
    void transferStarted(const TransferManifest &manifest, const QString &peer) override;
    void validationSummary(const QList<FailedValidation> &failures) override;

private:
    QMutex m_mutex;
    QTextStream m_out;
    bool m_progressLineOpen = false;

    void endProgressLine();
};

#endif // CONSOLE_OBSERVER_H

/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "console_observer.h"

#include <QMutexLocker>

#include <KLocalizedString>

#include <cstdio>

namespace {

constexpr int BAR_WIDTH = 40;

QString levelPrefix(StatusLevel level)
{
    switch (level) {
    case StatusLevel::Info:
        return QStringLiteral("[*] ");
    case StatusLevel::Success:
        return QStringLiteral("[+] ");
    case StatusLevel::Warning:
        return QStringLiteral("[!] ");
    case StatusLevel::Error:
        return QStringLiteral("[x] ");
    }
    return QString();
}

} // namespace

ConsoleObserver::ConsoleObserver()
    : m_out(stderr)
{
}

// Called with m_mutex held
void ConsoleObserver::endProgressLine()
{
    if (m_progressLineOpen) {
        m_out << '\n';
        m_progressLineOpen = false;
    }
}

void ConsoleObserver::transferProgress(qint64 done, qint64 total)
{
    QMutexLocker locker(&m_mutex);

    const double fraction = total > 0 ? qBound(0.0, double(done) / double(total), 1.0) : 1.0;
    const int filled = int(fraction * BAR_WIDTH);
    m_out << '\r' << '[' << QString(filled, QLatin1Char('#')) << QString(BAR_WIDTH - filled, QLatin1Char('-'))
          << "] " << QString::number(fraction * 100.0, 'f', 1) << "% "
          << formatSize(done) << " / " << formatSize(total);
    m_progressLineOpen = true;
    if (done >= total) {
        endProgressLine();
    }
    m_out.flush();
}

void ConsoleObserver::statusMessage(StatusLevel level, const QString &message)
{
    QMutexLocker locker(&m_mutex);
    endProgressLine();
    m_out << levelPrefix(level) << message << '\n';
    m_out.flush();
}

void ConsoleObserver::transferStarted(const TransferManifest &manifest, const QString &peer)
{
    QMutexLocker locker(&m_mutex);
    endProgressLine();
    if (manifest.kind == TransferKind::File) {
        m_out << levelPrefix(StatusLevel::Info)
              << i18n("Incoming file %1 (%2) from %3", manifest.name, formatSize(manifest.size), peer) << '\n';
    } else {
        m_out << levelPrefix(StatusLevel::Info)
              << i18np("Incoming directory %2 (%1 file, %3) from %4",
                       "Incoming directory %2 (%1 files, %3) from %4",
                       manifest.totalFiles, manifest.name, formatSize(manifest.totalSize), peer)
              << '\n';
    }
    m_out.flush();
}

void ConsoleObserver::validationSummary(const QList<FailedValidation> &failures)
{
    QMutexLocker locker(&m_mutex);
    endProgressLine();
    m_out << levelPrefix(StatusLevel::Warning)
          << i18np("%1 file failed hash verification:", "%1 files failed hash verification:", failures.size())
          << '\n';
    for (const FailedValidation &failure : failures) {
        m_out << "    " << failure.file << '\n'
              << "      " << i18n("expected: %1", failure.expected) << '\n'
              << "      " << i18n("received: %1", failure.received) << '\n';
    }
    m_out.flush();
}

/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "transfer_observer.h"

ProgressThrottle::ProgressThrottle(TransferObserver *observer, qint64 total, int intervalMs)
    : m_observer(observer)
    , m_total(total)
    , m_intervalMs(intervalMs)
{
}

void ProgressThrottle::update(qint64 done)
{
    m_done = done;
    if (!m_observer) {
        return;
    }
    if (m_timer.isValid() && m_timer.elapsed() < m_intervalMs) {
        return;
    }
    m_timer.start();
    m_reported = done;
    m_observer->transferProgress(done, m_total);
}

void ProgressThrottle::finish()
{
    if (m_observer && m_reported != m_done) {
        m_reported = m_done;
        m_observer->transferProgress(m_done, m_total);
    }
}

QString formatSize(qint64 size)
{
    if (size <= 0) {
        return QStringLiteral("0 B");
    }

    static const char *const units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(size);
    for (const char *unit : units) {
        if (value < 1024.0) {
            return QStringLiteral("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(unit));
        }
        value /= 1024.0;
    }
    return QStringLiteral("%1 EB").arg(value, 0, 'f', 1);
}

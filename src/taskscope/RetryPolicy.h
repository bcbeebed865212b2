/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TASKSCOPE_RETRYPOLICY_H
#define TASKSCOPE_RETRYPOLICY_H

#include "taskscope_export.h"

#include "Status.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QThread>

namespace Taskscope
{

inline const Status &statusOf(const Status &status)
{
    return status;
}

template<typename Result>
const Status &statusOf(const Result &result)
{
    return result.status;
}

/**
 * Exponential backoff for operations that failed with a recoverable error
 * (lock timeout, checksum mismatch, session id collision).
 *
 * The whole operation is re-run; nothing is resumed half-way. Retrying stops
 * after maxAttempts runs, or when the next delay would push the total wall
 * time past maxTotalMs.
 */
struct TASKSCOPE_EXPORT RetryPolicy {
    int maxAttempts = 3;
    int initialDelayMs = 100;
    double multiplier = 2.0;
    int maxTotalMs = 5000;

    /**
     * Delay before retry number @p retry (1-based).
     */
    int delayForRetry(int retry) const;

    static RetryPolicy noRetry()
    {
        RetryPolicy p;
        p.maxAttempts = 1;
        return p;
    }

    template<typename Operation>
    auto run(Operation op) const -> decltype(op())
    {
        QElapsedTimer timer;
        timer.start();

        auto result = op();
        for (int retry = 1; retry < maxAttempts && statusOf(result).isRecoverable(); ++retry) {
            const int delay = delayForRetry(retry);
            if (timer.elapsed() + delay > maxTotalMs) {
                qWarning() << "RetryPolicy: Giving up, wall time cap reached after" << retry << "attempt(s)";
                break;
            }
            qDebug() << "RetryPolicy: Retry" << retry << "in" << delay << "ms after" << statusOf(result).categoryName();
            QThread::msleep(static_cast<unsigned long>(delay));
            result = op();
        }
        return result;
    }
};

} // namespace Taskscope

#endif // TASKSCOPE_RETRYPOLICY_H

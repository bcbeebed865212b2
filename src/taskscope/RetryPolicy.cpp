/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "RetryPolicy.h"

#include <QtMath>

namespace Taskscope
{

int RetryPolicy::delayForRetry(int retry) const
{
    if (retry < 1) {
        return 0;
    }
    const double delay = initialDelayMs * qPow(multiplier, retry - 1);
    // Never sleep past the total cap in a single step
    return static_cast<int>(qMin(delay, static_cast<double>(maxTotalMs)));
}

} // namespace Taskscope

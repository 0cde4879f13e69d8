#include "vision/RetryPolicy.h"

#include <QtCore/QThread>

#include <algorithm>
#include <cmath>

namespace vision
{

namespace
{
constexpr int kSleepSliceMs = 50;
}

int RetryPolicy::backoffMs(int retry) const
{
    if (retry <= 0 || initialBackoffMs <= 0)
    {
        return 0;
    }
    const double delay = initialBackoffMs * std::pow(std::max(backoffMultiplier, 1.0), retry - 1);
    return static_cast<int>(std::min(delay, static_cast<double>(maxBackoffMs)));
}

bool sleepUnlessCancelled(int milliseconds, const common::CancellationToken& cancel)
{
    int remaining = milliseconds;
    while (remaining > 0)
    {
        if (cancel.isCancelled())
        {
            return false;
        }
        const int slice = std::min(remaining, kSleepSliceMs);
        QThread::msleep(static_cast<unsigned long>(slice));
        remaining -= slice;
    }
    return !cancel.isCancelled();
}

} // namespace vision

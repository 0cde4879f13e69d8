#pragma once

#include "common/Cancellation.h"

namespace vision
{

// Bounded exponential backoff for transient vision-service faults.
struct RetryPolicy
{
    int maxAttempts{3};
    int initialBackoffMs{1000};
    double backoffMultiplier{2.0};
    int maxBackoffMs{16000};

    // Delay before retry number `retry` (1-based).
    [[nodiscard]] int backoffMs(int retry) const;
};

// Sleeps in short slices; returns false as soon as the token is cancelled.
bool sleepUnlessCancelled(int milliseconds, const common::CancellationToken& cancel);

} // namespace vision

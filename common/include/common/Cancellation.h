#pragma once

#include <atomic>
#include <memory>

namespace common
{

// Shared flag polled by long-running stages. Cancelling never blocks.
class CancellationToken
{
public:
    void cancel() noexcept { m_cancelled.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> m_cancelled{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline CancellationTokenPtr makeCancellationToken()
{
    return std::make_shared<CancellationToken>();
}

} // namespace common

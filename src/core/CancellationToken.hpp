#pragma once

#include <atomic>

namespace mcp_bridge {

/**
 * @brief Flag shared between a caller and an in-flight operation
 *
 * The operation polls is_cancelled() while it waits; cancel() may be
 * called from any thread, including a signal-driven abort path.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace mcp_bridge

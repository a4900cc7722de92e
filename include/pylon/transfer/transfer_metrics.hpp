#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace pylon
{

// ============================================================================
// Metrics
// ============================================================================

struct transfer_metrics
{
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> messages_sent{0};
    std::atomic<uint64_t> messages_received{0};
    std::atomic<uint64_t> errors{0};
    std::chrono::steady_clock::time_point created_at{std::chrono::steady_clock::now()};

    std::chrono::milliseconds uptime() const
    {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - created_at);
    }
};

} // namespace pylon

#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace pylon
{

struct progress_event
{
    uint64_t bytes_transferred{0};
    uint64_t total_bytes{0};

    bool operator==(const progress_event&) const = default;
};

// ============================================================================
// Progress Queue
// ============================================================================

// Filled by a running transfer at every chunk boundary, drained by the caller at
// its own pace. Pushing never blocks the transfer.
class progress_queue
{
    mutable std::mutex mutex_;
    std::deque<progress_event> events_;
    std::optional<progress_event> last_;

  public:
    void push(progress_event event)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        last_ = event;
    }

    std::optional<progress_event> try_pop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty())
            return std::nullopt;

        auto event = events_.front();
        events_.pop_front();
        return event;
    }

    std::vector<progress_event> drain()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<progress_event> out(events_.begin(), events_.end());
        events_.clear();
        return out;
    }

    // Most recent event, drained or not.
    std::optional<progress_event> last() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }
};

}  // namespace pylon

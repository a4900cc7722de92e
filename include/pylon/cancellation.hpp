#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace pylon
{

namespace detail
{
struct cancel_state
{
    std::mutex mutex;
    bool cancelled{false};
    uint64_t next_id{1};
    std::map<uint64_t, std::function<void()>> callbacks;
};
}  // namespace detail

// ============================================================================
// Cancel Registration
// ============================================================================

// Unsubscribes its callback on destruction.
class cancel_registration
{
    std::weak_ptr<detail::cancel_state> state_;
    uint64_t id_{0};

  public:
    cancel_registration() = default;

    cancel_registration(std::weak_ptr<detail::cancel_state> state, uint64_t id)
      : state_(std::move(state))
      , id_(id)
    {
    }

    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;

    cancel_registration(cancel_registration&& other) noexcept
      : state_(std::move(other.state_))
      , id_(std::exchange(other.id_, 0))
    {
    }

    cancel_registration& operator=(cancel_registration&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~cancel_registration()
    {
        reset();
    }

    void reset()
    {
        if (id_ == 0)
            return;

        if (auto state = state_.lock())
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->callbacks.erase(id_);
        }
        id_ = 0;
        state_.reset();
    }
};

// ============================================================================
// Cancel Token
// ============================================================================

// Read side of a cancellation signal. A default-constructed token is never cancelled.
class cancel_token
{
    std::shared_ptr<detail::cancel_state> state_;

  public:
    cancel_token() = default;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
      : state_(std::move(state))
    {
    }

    bool is_cancelled() const
    {
        if (!state_)
            return false;

        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    bool can_be_cancelled() const
    {
        return state_ != nullptr;
    }

    // The callback runs once, on the thread calling cancel(), or right away when the
    // signal already fired. It must not block.
    [[nodiscard]] cancel_registration on_cancel(std::function<void()> callback) const
    {
        if (!state_)
            return {};

        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled)
            {
                auto id = state_->next_id++;
                state_->callbacks.emplace(id, std::move(callback));
                return {state_, id};
            }
        }

        callback();
        return {};
    }
};

// ============================================================================
// Cancel Source
// ============================================================================

class cancel_source
{
    std::shared_ptr<detail::cancel_state> state_{std::make_shared<detail::cancel_state>()};

  public:
    cancel_token token() const
    {
        return cancel_token{state_};
    }

    bool is_cancelled() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    // Fires the signal. Later calls do nothing.
    void cancel()
    {
        std::vector<std::function<void()>> to_run;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled)
                return;

            state_->cancelled = true;
            for (auto& [id, callback] : state_->callbacks)
                to_run.push_back(std::move(callback));
            state_->callbacks.clear();
        }

        for (auto& callback : to_run)
            callback();
    }
};

}  // namespace pylon

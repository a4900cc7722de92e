#pragma once

#include <pylon/cancellation.hpp>
#include <pylon/error.hpp>
#include <pylon/transfer/message_channel.hpp>

#include <utility>
#include <boost/asio.hpp>

#include <memory>
#include <string>
#include <utility>

namespace pylon
{

enum class transfer_outcome
{
    completed,
    cancelled
};

const char* to_string(transfer_outcome outcome) noexcept;

// ============================================================================
// Transfer Operation
// ============================================================================

// Common lifetime of one send, request or accept: it owns the message channel,
// listens to its cancel token and finishes exactly once. Finishing closes the
// channel, so nothing outlives the operation.
class transfer_operation : public std::enable_shared_from_this<transfer_operation>
{
  public:
    transfer_operation(const transfer_operation&) = delete;
    transfer_operation& operator=(const transfer_operation&) = delete;
    transfer_operation(transfer_operation&&) = delete;
    transfer_operation& operator=(transfer_operation&&) = delete;
    virtual ~transfer_operation() = default;

    bool is_finished() const
    {
        return finished_;
    }

    // Finished, or on the way out after a cancel or an abort. Late completions
    // arriving in this state are ignored.
    bool is_stopping() const
    {
        return finished_ || cancelling_;
    }

  protected:
    transfer_operation(boost::asio::io_context& io_context, message_channel_ptr channel, cancel_token cancel, const char* role);

    // Subscribes to the cancel token; a cancel request is handled on the io_context.
    void watch_cancellation();

    // True when the operation should stop at this chunk boundary. Starts the
    // cancellation when the token fired in the meantime.
    bool stop_requested();

    void finish(result<transfer_outcome> outcome);

    // Tells the peer why we stop, then finishes with err.
    void abort_with(error err);

    // Finishes after a failed send. A peer that closed the channel may have
    // queued an abort first; its reason replaces err.
    void fail_after_send(error err);

    // Hands the channel over to a follow-up operation; finishing no longer closes it.
    message_channel_ptr release_channel();

    // Error for a message that is not the expected one; turns a peer abort into
    // a readable error.
    error unexpected(const decoded_frame& frame, const char* expected) const;

    virtual void on_finished(result<transfer_outcome> outcome) = 0;

    template<typename Derived>
    std::shared_ptr<Derived> shared_self()
    {
        return std::static_pointer_cast<Derived>(shared_from_this());
    }

    boost::asio::io_context& io_context_;
    message_channel_ptr channel_;
    cancel_token cancel_;
    const char* role_;

  private:
    void on_cancel_requested();

    cancel_registration cancel_registration_;
    bool finished_{false};
    bool cancelling_{false};
};

// Transit negotiation outcome shared by both roles.
result<transit_abilities> negotiate_transit(transit_abilities ours, const transit_request& theirs);

}  // namespace pylon

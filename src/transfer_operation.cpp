#include <pylon/transfer/transfer_operation.hpp>
#include <pylon/channel/channel_error.hpp>
#include <pylon/logger.hpp>

#include <fmt/core.h>

namespace pylon
{

const char* to_string(transfer_outcome outcome) noexcept
{
    switch (outcome)
    {
        case transfer_outcome::completed:
            return "completed";
        case transfer_outcome::cancelled:
            return "cancelled";
    }
    return "unknown";
}

transfer_operation::transfer_operation(boost::asio::io_context& io_context, message_channel_ptr channel, cancel_token cancel, const char* role)
  : io_context_(io_context)
  , channel_(std::move(channel))
  , cancel_(std::move(cancel))
  , role_(role)
{
}

void transfer_operation::watch_cancellation()
{
    // The callback may run on any thread; the channel is only touched on the io_context.
    cancel_registration_ = cancel_.on_cancel([&io_context = io_context_, wptr = weak_from_this()] {
        boost::asio::post(io_context, [wptr] {
            if (auto self = wptr.lock())
                self->on_cancel_requested();
        });
    });
}

bool transfer_operation::stop_requested()
{
    if (finished_ || cancelling_)
        return true;

    if (cancel_.is_cancelled())
    {
        on_cancel_requested();
        return true;
    }
    return false;
}

void transfer_operation::on_cancel_requested()
{
    if (finished_ || cancelling_)
        return;

    cancelling_ = true;
    log_info("{}: cancelled, notifying peer", role_);

    if (!channel_)
        return finish(transfer_outcome::cancelled);

    channel_->send(transfer_abort{fmt::format("cancelled by {}", role_)}, [self = shared_from_this()](result<void>) {
        // The peer may already be gone; cancellation wins either way.
        self->finish(transfer_outcome::cancelled);
    }, message_status::failed);
}

void transfer_operation::finish(result<transfer_outcome> outcome)
{
    if (finished_)
        return;

    finished_ = true;
    cancel_registration_.reset();
    if (channel_)
        channel_->close();

    if (outcome)
        log_info("{}: transfer {}", role_, to_string(outcome.value()));
    else
        log_warning("{}: {}", role_, outcome.error().what());

    on_finished(std::move(outcome));
}

void transfer_operation::abort_with(error err)
{
    if (finished_ || cancelling_)
        return;

    cancelling_ = true;
    if (!channel_)
        return finish(std::move(err));

    channel_->send(transfer_abort{err.message()}, [self = shared_from_this(), err](result<void>) {
        self->finish(err);
    }, message_status::failed);
}

void transfer_operation::fail_after_send(error err)
{
    if (!channel_ || !(err.cause() == channel::errc::peer_closed))
        return finish(std::move(err));

    channel_->receive([self = shared_from_this(), err = std::move(err)](result<decoded_frame> frame) {
        if (self->finished_)
            return;

        if (frame)
        {
            if (auto* abort = std::get_if<transfer_abort>(&frame.value().body))
                return self->finish(error::transfer(fmt::format("peer aborted the transfer: {}", abort->reason), err.cause()));
        }
        self->finish(err);
    });
}

message_channel_ptr transfer_operation::release_channel()
{
    cancel_registration_.reset();
    return std::exchange(channel_, nullptr);
}

error transfer_operation::unexpected(const decoded_frame& frame, const char* expected) const
{
    if (auto* abort = std::get_if<transfer_abort>(&frame.body))
        return error::transfer(fmt::format("peer aborted the transfer: {}", abort->reason));

    return error::transfer(fmt::format("protocol violation: expected {}, got {}", expected, to_string(frame.header.id)));
}

result<transit_abilities> negotiate_transit(transit_abilities ours, const transit_request& theirs)
{
    auto common = ours.intersect(theirs.abilities);
    if (common.empty())
        return error::transfer(fmt::format("no transit ability in common with peer (ours: {}, theirs: {})",
                                           ours.to_string(), theirs.abilities.to_string()));
    return common;
}

}  // namespace pylon

#include <pylon/transfer/offer_receiver.hpp>
#include <pylon/channel/channel_error.hpp>
#include <pylon/logger.hpp>

namespace pylon
{

offer_receiver::offer_receiver(boost::asio::io_context& io_context, message_channel_ptr channel, parameters params, completion_handler handler)
  : transfer_operation(io_context, std::move(channel), params.cancel, "receiver")
  , params_(std::move(params))
  , handler_(std::move(handler))
{
}

void offer_receiver::start()
{
    log_info("receiver: waiting for an offer, relay {}", params_.relay.to_string());

    watch_cancellation();

    transit_request transit{params_.abilities, params_.relay.to_string()};
    channel_->send(transit, [self = shared_self<offer_receiver>()](result<void> sent) {
        if (self->is_stopping())
            return;
        if (!sent)
            return self->on_channel_error(sent.error());

        self->channel_->receive([self](result<decoded_frame> frame) { self->on_peer_transit(std::move(frame)); });
    });
}

void offer_receiver::on_peer_transit(result<decoded_frame> frame)
{
    if (is_stopping())
        return;
    if (!frame)
        return on_channel_error(frame.error());

    auto* transit = std::get_if<transit_request>(&frame.value().body);
    if (!transit)
        return abort_with(unexpected(frame.value(), "transit"));

    auto common = negotiate_transit(params_.abilities, *transit);
    if (!common)
        return abort_with(common.error());

    log_debug("receiver: transit {} with peer relay {}", common.value().to_string(), transit->relay_hint);

    channel_->receive([self = shared_self<offer_receiver>()](result<decoded_frame> next) { self->on_offer(std::move(next)); });
}

void offer_receiver::on_offer(result<decoded_frame> frame)
{
    if (is_stopping())
        return;

    if (!frame)
        return on_channel_error(frame.error());

    auto* offer = std::get_if<file_offer>(&frame.value().body);
    if (!offer)
        return abort_with(unexpected(frame.value(), "offer"));

    log_info("receiver: offered '{}' ({} bytes)", offer->file_name, offer->file_size);

    offer_ = std::make_shared<received_offer>(io_context_, release_channel(), std::move(*offer));
    finish(transfer_outcome::completed);
}

void offer_receiver::on_channel_error(const error& err)
{
    // Leaving without an offer is the peer's right.
    if (err.cause() == channel::errc::peer_closed)
    {
        log_info("receiver: peer closed the channel without an offer");
        return finish(transfer_outcome::completed);
    }
    finish(err);
}

void offer_receiver::on_finished(result<transfer_outcome> outcome)
{
    if (handler_)
        boost::asio::post(io_context_, [handler = std::move(handler_), outcome = std::move(outcome), offer = std::move(offer_)] {
            handler(outcome, offer);
        });
}

}  // namespace pylon

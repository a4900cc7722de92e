#pragma once

#include <pylon/transfer/received_offer.hpp>
#include <pylon/transfer/relay_hint.hpp>
#include <pylon/transfer/transfer_operation.hpp>

#include <functional>
#include <memory>

namespace pylon
{

// ============================================================================
// Offer Receiver
// ============================================================================

// Receiver role up to the offer: transit exchange, then wait for the peer to
// offer a file. The channel moves on to the received_offer.
class offer_receiver : public transfer_operation
{
  public:
    using completion_handler = std::function<void(result<transfer_outcome>, offer_ptr)>;

    struct parameters
    {
        cancel_token cancel;
        relay_hint relay;
        transit_abilities abilities{transit_abilities::all()};
    };

    offer_receiver(boost::asio::io_context& io_context, message_channel_ptr channel, parameters params, completion_handler handler);

    void start();

  private:
    void on_peer_transit(result<decoded_frame> frame);
    void on_offer(result<decoded_frame> frame);
    void on_channel_error(const error& err);

    void on_finished(result<transfer_outcome> outcome) override;

    parameters params_;
    completion_handler handler_;
    offer_ptr offer_;
};

}  // namespace pylon

#pragma once

#include <pylon/config.hpp>
#include <pylon/progress.hpp>
#include <pylon/transfer/relay_hint.hpp>
#include <pylon/transfer/transfer_operation.hpp>

#include <functional>
#include <istream>
#include <memory>
#include <string>

namespace pylon
{

// ============================================================================
// File Sender
// ============================================================================

// Sender role: transit exchange, offer, chunk streaming, final acknowledgement.
class file_sender : public transfer_operation
{
  public:
    using completion_handler = std::function<void(result<transfer_outcome>)>;

    struct parameters
    {
        std::unique_ptr<std::istream> reader;
        std::string file_name;
        uint64_t declared_size{0};
        std::shared_ptr<progress_queue> progress;
        cancel_token cancel;
        relay_hint relay;
        transit_abilities abilities{transit_abilities::all()};
        transfer_config config;
    };

    file_sender(boost::asio::io_context& io_context, message_channel_ptr channel, parameters params, completion_handler handler);

    void start();

  private:
    void on_peer_transit(result<decoded_frame> frame);
    void send_offer();
    void on_answer(result<decoded_frame> frame);
    void send_next_chunk();
    void wait_for_ack();
    void on_ack(result<decoded_frame> frame);
    void report_progress();

    void on_finished(result<transfer_outcome> outcome) override;

    parameters params_;
    completion_handler handler_;
    uint64_t bytes_sent_{0};
};

}  // namespace pylon

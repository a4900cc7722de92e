#pragma once

#include <pylon/progress.hpp>
#include <pylon/transfer/transfer_operation.hpp>

#include <functional>
#include <memory>
#include <ostream>
#include <string>

namespace pylon
{

// ============================================================================
// Received Offer
// ============================================================================

// File the peer wants to send. Answer it once: accept() streams the bytes into
// a writer, reject() declines and closes the channel. Dropping an unanswered
// offer closes the channel without an answer.
class received_offer : public transfer_operation
{
  public:
    using completion_handler = std::function<void(result<transfer_outcome>)>;
    using reject_handler = std::function<void(result<void>)>;

    received_offer(boost::asio::io_context& io_context, message_channel_ptr channel, file_offer offer);

    const std::string& file_name() const
    {
        return offer_.file_name;
    }

    uint64_t file_size() const
    {
        return offer_.file_size;
    }

    const file_offer& offer() const
    {
        return offer_;
    }

    bool is_answered() const
    {
        return answered_;
    }

    uint64_t bytes_received() const
    {
        return bytes_received_;
    }

    void accept(std::unique_ptr<std::ostream> writer, std::shared_ptr<progress_queue> progress, cancel_token cancel, completion_handler handler);

    void reject(reject_handler handler);

  private:
    void receive_next();
    void on_chunk(result<decoded_frame> frame);
    void send_ack();
    void report_progress();

    void on_finished(result<transfer_outcome> outcome) override;

    file_offer offer_;
    bool answered_{false};
    std::unique_ptr<std::ostream> writer_;
    std::shared_ptr<progress_queue> progress_;
    completion_handler handler_;
    uint64_t bytes_received_{0};
};

using offer_ptr = std::shared_ptr<received_offer>;

}  // namespace pylon

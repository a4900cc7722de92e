#pragma once

#include <pylon/channel/secure_channel.hpp>
#include <pylon/error.hpp>
#include <pylon/transfer/frame.hpp>
#include <pylon/transfer/transfer_metrics.hpp>

#include <utility>
#include <boost/asio.hpp>

#include <functional>
#include <string>
#include <memory>
#include <vector>

namespace pylon
{

// ============================================================================
// Message Channel
// ============================================================================

// Transfer messages on top of a secure channel, one frame per channel message.
// Every failure, from the channel or from decoding, comes back as errc::transfer.
// Handlers may outlive the message_channel; owned through shared_ptr only.
class message_channel : public std::enable_shared_from_this<message_channel>
{
  public:
    using send_handler = std::function<void(result<void>)>;
    using receive_handler = std::function<void(result<decoded_frame>)>;

    message_channel(boost::asio::any_io_executor executor, channel::channel_ptr channel)
      : executor_(std::move(executor))
      , channel_(std::move(channel))
    {
    }

    message_channel(const message_channel&) = delete;
    message_channel& operator=(const message_channel&) = delete;
    message_channel(message_channel&&) = delete;
    message_channel& operator=(message_channel&&) = delete;

    ~message_channel()
    {
        close();
    }

    template<typename PDU>
    void send(const PDU& pdu, send_handler handler, message_status status = message_status::ok)
    {
        std::vector<uint8_t> frame;
        try
        {
            frame = encode_frame(pdu, next_sequence_number(), status);
        }
        catch (const std::exception& ex)
        {
            boost::asio::post(executor_, [handler = std::move(handler), what = std::string{ex.what()}] {
                handler(error::transfer("cannot encode message: " + what));
            });
            return;
        }
        send_frame(std::move(frame), std::move(handler));
    }

    void receive(receive_handler handler);

    void close();

    bool is_open() const
    {
        return channel_ && channel_->is_open();
    }

    const transfer_metrics& metrics() const
    {
        return metrics_;
    }

  private:
    void send_frame(std::vector<uint8_t> frame, send_handler handler);

    uint32_t next_sequence_number()
    {
        // Wraps from 0xFFFFFFFF to 1
        if (++sequence_number_ == 0)
            sequence_number_ = 1;
        return sequence_number_;
    }

    boost::asio::any_io_executor executor_;
    channel::channel_ptr channel_;
    uint32_t sequence_number_{0};
    transfer_metrics metrics_;
};

using message_channel_ptr = std::shared_ptr<message_channel>;

}  // namespace pylon

#include <pylon/transfer/message_channel.hpp>
#include <pylon/logger.hpp>

#include <optional>
#include <utility>

namespace pylon
{

void message_channel::send_frame(std::vector<uint8_t> frame, send_handler handler)
{
    if (!channel_)
    {
        boost::asio::post(executor_, [handler = std::move(handler)] {
            handler(error::transfer("message channel is closed"));
        });
        return;
    }

    auto size = frame.size();
    channel_->async_send(std::move(frame), [wptr = weak_from_this(), handler = std::move(handler), size](const boost::system::error_code& ec) {
        auto self = wptr.lock();
        if (ec)
        {
            if (self)
                ++self->metrics_.errors;
            handler(error::transfer("sending to the peer failed", ec));
            return;
        }

        if (self)
        {
            self->metrics_.bytes_sent += size;
            ++self->metrics_.messages_sent;
        }
        handler({});
    });
}

void message_channel::receive(receive_handler handler)
{
    if (!channel_)
    {
        boost::asio::post(executor_, [handler = std::move(handler)] {
            handler(error::transfer("message channel is closed"));
        });
        return;
    }

    channel_->async_receive([wptr = weak_from_this(), handler = std::move(handler)](const boost::system::error_code& ec, std::vector<uint8_t> frame) {
        auto self = wptr.lock();
        if (ec)
        {
            if (self)
                ++self->metrics_.errors;
            handler(error::transfer("receiving from the peer failed", ec));
            return;
        }

        if (self)
        {
            self->metrics_.bytes_received += frame.size();
            ++self->metrics_.messages_received;
        }

        std::optional<decoded_frame> decoded;
        try
        {
            decoded = decode_frame(frame);
        }
        catch (const std::exception& ex)
        {
            if (self)
                ++self->metrics_.errors;
            handler(error::transfer(std::string{"malformed message from peer: "} + ex.what()));
            return;
        }

        log_debug("transfer: received {} #{} ({} bytes)", to_string(decoded->header.id), decoded->header.sequence_number, frame.size());
        handler(std::move(*decoded));
    });
}

void message_channel::close()
{
    if (!channel_)
        return;

    std::exchange(channel_, nullptr)->close();
    log_debug("transfer: channel closed after {} ms, {} messages out ({} bytes), {} in ({} bytes), {} errors",
              metrics_.uptime().count(), metrics_.messages_sent.load(), metrics_.bytes_sent.load(),
              metrics_.messages_received.load(), metrics_.bytes_received.load(), metrics_.errors.load());
}

}  // namespace pylon

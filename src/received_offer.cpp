#include <pylon/transfer/received_offer.hpp>
#include <pylon/logger.hpp>

#include <fmt/core.h>

#include <optional>

namespace pylon
{

received_offer::received_offer(boost::asio::io_context& io_context, message_channel_ptr channel, file_offer offer)
  : transfer_operation(io_context, std::move(channel), cancel_token{}, "receiver")
  , offer_(std::move(offer))
{
}

void received_offer::accept(std::unique_ptr<std::ostream> writer, std::shared_ptr<progress_queue> progress, cancel_token cancel, completion_handler handler)
{
    auto precondition = [&]() -> std::optional<error> {
        if (answered_)
            return error::generic(fmt::format("offer for '{}' was already answered", offer_.file_name));
        if (is_finished())
            return error::generic("offer is no longer valid");
        if (!writer)
            return error::generic("no writer given for the received file");
        return std::nullopt;
    }();

    if (precondition)
    {
        boost::asio::post(io_context_, [handler = std::move(handler), err = std::move(*precondition)] { handler(err); });
        return;
    }

    answered_ = true;
    writer_ = std::move(writer);
    progress_ = progress ? std::move(progress) : std::make_shared<progress_queue>();
    handler_ = std::move(handler);
    cancel_ = std::move(cancel);

    log_info("receiver: accepting '{}' ({} bytes)", offer_.file_name, offer_.file_size);

    watch_cancellation();
    if (stop_requested())
        return;

    channel_->send(offer_answer{true}, [self = shared_self<received_offer>()](result<void> sent) {
        if (self->is_stopping())
            return;
        if (!sent)
            return self->finish(sent.error());

        if (self->offer_.file_size == 0)
        {
            self->report_progress();
            return self->send_ack();
        }
        self->receive_next();
    });
}

void received_offer::reject(reject_handler handler)
{
    if (answered_ || is_finished())
    {
        boost::asio::post(io_context_, [handler = std::move(handler), name = offer_.file_name] {
            handler(error::generic(fmt::format("offer for '{}' was already answered", name)));
        });
        return;
    }

    answered_ = true;
    log_info("receiver: rejecting '{}'", offer_.file_name);

    channel_->send(offer_answer{false}, [self = shared_self<received_offer>(), handler = std::move(handler)](result<void> sent) {
        self->finish(sent ? result<transfer_outcome>{transfer_outcome::completed} : result<transfer_outcome>{sent.error()});
        boost::asio::post(self->io_context_, [handler, sent] { handler(sent); });
    });
}

void received_offer::receive_next()
{
    channel_->receive([self = shared_self<received_offer>()](result<decoded_frame> frame) { self->on_chunk(std::move(frame)); });
}

void received_offer::on_chunk(result<decoded_frame> frame)
{
    if (is_stopping())
        return;
    if (!frame)
        return finish(frame.error());

    auto* chunk = std::get_if<file_chunk>(&frame.value().body);
    if (!chunk)
        return abort_with(unexpected(frame.value(), "chunk"));

    if (chunk->data.size() > offer_.file_size - bytes_received_)
        return abort_with(error::transfer(fmt::format("peer sent more than the offered {} bytes", offer_.file_size)));

    writer_->write(reinterpret_cast<const char*>(chunk->data.data()), static_cast<std::streamsize>(chunk->data.size()));
    if (!*writer_)
        return abort_with(error::transfer(fmt::format("writing '{}' failed after {} bytes", offer_.file_name, bytes_received_)));

    bytes_received_ += chunk->data.size();
    report_progress();

    if (bytes_received_ == offer_.file_size)
    {
        writer_->flush();
        return send_ack();
    }

    if (stop_requested())
        return;

    receive_next();
}

void received_offer::send_ack()
{
    channel_->send(transfer_ack{bytes_received_}, [self = shared_self<received_offer>()](result<void> sent) {
        if (self->is_stopping())
            return;
        if (!sent)
            return self->finish(sent.error());

        self->finish(transfer_outcome::completed);
    });
}

void received_offer::report_progress()
{
    log_debug("receiver: {}/{} bytes", bytes_received_, offer_.file_size);
    progress_->push({bytes_received_, offer_.file_size});
}

void received_offer::on_finished(result<transfer_outcome> outcome)
{
    writer_.reset();
    if (handler_)
        boost::asio::post(io_context_, [handler = std::move(handler_), outcome = std::move(outcome)] { handler(outcome); });
}

}  // namespace pylon

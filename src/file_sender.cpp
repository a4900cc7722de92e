#include <pylon/transfer/file_sender.hpp>
#include <pylon/logger.hpp>

#include <fmt/core.h>

#include <algorithm>

namespace pylon
{

file_sender::file_sender(boost::asio::io_context& io_context, message_channel_ptr channel, parameters params, completion_handler handler)
  : transfer_operation(io_context, std::move(channel), params.cancel, "sender")
  , params_(std::move(params))
  , handler_(std::move(handler))
{
    if (!params_.progress)
        params_.progress = std::make_shared<progress_queue>();
}

void file_sender::start()
{
    log_info("sender: offering '{}' ({} bytes) via {}", params_.file_name, params_.declared_size, params_.relay.to_string());

    watch_cancellation();

    transit_request transit{params_.abilities, params_.relay.to_string()};
    channel_->send(transit, [self = shared_self<file_sender>()](result<void> sent) {
        if (self->is_stopping())
            return;
        if (!sent)
            return self->fail_after_send(sent.error());

        self->channel_->receive([self](result<decoded_frame> frame) { self->on_peer_transit(std::move(frame)); });
    });
}

void file_sender::on_peer_transit(result<decoded_frame> frame)
{
    if (is_stopping())
        return;
    if (!frame)
        return finish(frame.error());

    auto* transit = std::get_if<transit_request>(&frame.value().body);
    if (!transit)
        return abort_with(unexpected(frame.value(), "transit"));

    auto common = negotiate_transit(params_.abilities, *transit);
    if (!common)
        return abort_with(common.error());

    log_debug("sender: transit {} with peer relay {}", common.value().to_string(), transit->relay_hint);
    send_offer();
}

void file_sender::send_offer()
{
    file_offer offer{params_.file_name, params_.declared_size};
    channel_->send(offer, [self = shared_self<file_sender>()](result<void> sent) {
        if (self->is_stopping())
            return;
        if (!sent)
            return self->fail_after_send(sent.error());

        self->channel_->receive([self](result<decoded_frame> frame) { self->on_answer(std::move(frame)); });
    });
}

void file_sender::on_answer(result<decoded_frame> frame)
{
    if (is_stopping())
        return;
    if (!frame)
        return finish(frame.error());

    auto* answer = std::get_if<offer_answer>(&frame.value().body);
    if (!answer)
        return abort_with(unexpected(frame.value(), "answer"));

    if (!answer->accepted)
        return finish(error::transfer(fmt::format("peer rejected '{}'", params_.file_name)));

    if (params_.declared_size == 0)
    {
        if (params_.reader->peek() != std::istream::traits_type::eof())
            return abort_with(error::transfer("source holds more than the declared 0 bytes"));

        report_progress();
        return wait_for_ack();
    }

    send_next_chunk();
}

void file_sender::send_next_chunk()
{
    if (stop_requested())
        return;

    auto& reader = *params_.reader;
    auto remaining = params_.declared_size - bytes_sent_;

    if (remaining == 0)
        return wait_for_ack();

    file_chunk chunk;
    chunk.data.resize(static_cast<size_t>(std::min<uint64_t>(remaining, params_.config.chunk_size)));
    reader.read(reinterpret_cast<char*>(chunk.data.data()), static_cast<std::streamsize>(chunk.data.size()));
    auto got = static_cast<size_t>(reader.gcount());

    if (reader.bad())
        return abort_with(error::transfer(fmt::format("reading '{}' failed after {} bytes", params_.file_name, bytes_sent_ + got)));

    if (got < chunk.data.size())
        return abort_with(error::transfer(fmt::format("declared size is {} bytes but the source ended after {}", params_.declared_size, bytes_sent_ + got)));

    // Last chunk: the source must end with it.
    if (got == remaining && reader.peek() != std::istream::traits_type::eof())
        return abort_with(error::transfer(fmt::format("source holds more than the declared {} bytes", params_.declared_size)));

    channel_->send(chunk, [self = shared_self<file_sender>(), got](result<void> sent) {
        if (self->is_stopping())
            return;
        if (!sent)
            return self->fail_after_send(sent.error());

        self->bytes_sent_ += got;
        self->report_progress();
        self->send_next_chunk();
    });
}

void file_sender::wait_for_ack()
{
    channel_->receive([self = shared_self<file_sender>()](result<decoded_frame> frame) { self->on_ack(std::move(frame)); });
}

void file_sender::on_ack(result<decoded_frame> frame)
{
    if (is_stopping())
        return;
    if (!frame)
        return finish(frame.error());

    auto* ack = std::get_if<transfer_ack>(&frame.value().body);
    if (!ack)
        return abort_with(unexpected(frame.value(), "ack"));

    if (ack->bytes_received != bytes_sent_)
        return finish(error::transfer(fmt::format("integrity mismatch: peer received {} of {} bytes", ack->bytes_received, bytes_sent_)));

    finish(transfer_outcome::completed);
}

void file_sender::report_progress()
{
    log_debug("sender: {}/{} bytes", bytes_sent_, params_.declared_size);
    params_.progress->push({bytes_sent_, params_.declared_size});
}

void file_sender::on_finished(result<transfer_outcome> outcome)
{
    params_.reader.reset();
    if (handler_)
        boost::asio::post(io_context_, [handler = std::move(handler_), outcome = std::move(outcome)] { handler(outcome); });
}

}  // namespace pylon

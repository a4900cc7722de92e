#include <pylon/session.hpp>
#include <pylon/logger.hpp>
#include <pylon/transfer/file_sender.hpp>
#include <pylon/transfer/offer_receiver.hpp>
#include <pylon/transfer/relay_hint.hpp>

#include <fmt/core.h>

#include <utility>

namespace pylon
{

const char* to_string(session_status status) noexcept
{
    switch (status)
    {
        case session_status::idle:
            return "idle";
        case session_status::handshaking:
            return "handshaking";
        case session_status::connected:
            return "connected";
        case session_status::consumed:
            return "consumed";
        case session_status::destroyed:
            return "destroyed";
    }
    return "unknown";
}

session::session(boost::asio::io_context& io_context, channel::rendezvous_ptr rendezvous, app_config config, transfer_config transfer)
  : io_context_(io_context)
  , rendezvous_(std::move(rendezvous))
  , config_(std::move(config))
  , transfer_(transfer)
{
}

session::~session()
{
    if (!std::holds_alternative<state::destroyed>(state_))
        release();
}

// ============================================================================
// Handshake
// ============================================================================

void session::generate_code(std::size_t code_length, code_handler handler)
{
    if (auto err = check_idle("generate_code"))
        return post_result(std::move(handler), std::move(*err));

    if (code_length == 0)
        return post_result(std::move(handler), error::generic("generate_code: code length must be positive"));

    auto generation = begin_handshake("sender");
    rendezvous_->async_connect_without_code(config_, code_length,
        [wptr = weak_from_this(), generation, handler = std::move(handler)](const boost::system::error_code& ec, channel::welcome welcome, channel::handshake_ptr handshake) {
            auto self = wptr.lock();
            if (!self)
            {
                if (handshake)
                    handshake->cancel();
                return handler(error::generic("session is gone"));
            }
            handler(self->on_welcome(generation, ec, std::move(welcome), std::move(handshake)));
        });
}

void session::connect_with_code(std::string code, connect_handler handler)
{
    if (auto err = check_idle("connect_with_code"))
        return post_result(std::move(handler), std::move(*err));

    if (code.empty())
        return post_result(std::move(handler), error::generic("connect_with_code: code must not be empty"));

    auto generation = begin_handshake("receiver");
    rendezvous_->async_connect_with_code(config_, code,
        [wptr = weak_from_this(), generation, handler = std::move(handler)](const boost::system::error_code& ec, channel::welcome welcome, channel::handshake_ptr handshake) {
            auto self = wptr.lock();
            if (!self)
            {
                if (handshake)
                    handshake->cancel();
                return handler(error::generic("session is gone"));
            }

            auto joined = self->on_welcome(generation, ec, std::move(welcome), std::move(handshake));
            if (!joined)
                return handler(joined.error());
            handler({});
        });
}

void session::wait_connected(connect_handler handler)
{
    switch (status())
    {
        case session_status::connected:
            return post_result(std::move(handler), result<void>{});
        case session_status::handshaking:
            waiters_.push_back(std::move(handler));
            return;
        case session_status::destroyed:
            return post_result(std::move(handler), error::generic("wait_connected: session was destroyed"));
        default:
            return post_result(std::move(handler), error::generic(fmt::format("wait_connected: no handshake to wait for (session is {})", to_string(status()))));
    }
}

std::optional<error> session::check_idle(const char* operation) const
{
    // Rendezvous replies find the session through a weak_ptr.
    if (weak_from_this().expired())
        return error::generic(fmt::format("{}: session is not owned by a shared_ptr", operation));

    switch (status())
    {
        case session_status::idle:
            return std::nullopt;
        case session_status::destroyed:
            return error::generic(fmt::format("{}: session was destroyed", operation));
        case session_status::handshaking:
            return error::codegen(fmt::format("{}: a handshake is already pending", operation));
        default:
            return error::codegen(fmt::format("{}: a secure channel was already established", operation));
    }
}

uint64_t session::begin_handshake(const char* role)
{
    log_info("session: starting handshake as {} on {}", role, config_.rendezvous_url);
    code_.clear();
    motd_.clear();
    transition_to(state::handshaking{});
    return ++generation_;
}

result<std::string> session::on_welcome(uint64_t generation, const boost::system::error_code& ec, channel::welcome welcome, channel::handshake_ptr handshake)
{
    if (generation != generation_ || !std::holds_alternative<state::handshaking>(state_))
    {
        if (handshake)
            handshake->cancel();
        return error::generic("session was destroyed while contacting the rendezvous");
    }

    if (ec)
    {
        auto err = error::channel(fmt::format("rendezvous at {} failed", config_.rendezvous_url), ec);
        log_error("session: {}", err.what());
        transition_to(state::idle{});
        notify_waiters(err);
        return err;
    }

    code_ = std::move(welcome.code);
    motd_ = std::move(welcome.motd);
    if (!motd_.empty())
        log_info("session: rendezvous says: {}", motd_);

    std::get<state::handshaking>(state_).handshake = handshake;
    handshake->async_wait([wptr = weak_from_this(), generation](const boost::system::error_code& wait_ec, channel::channel_ptr channel) {
        if (auto self = wptr.lock())
            self->on_handshake(generation, wait_ec, std::move(channel));
        else if (channel)
            channel->close();
    });

    return code_;
}

void session::on_handshake(uint64_t generation, const boost::system::error_code& ec, channel::channel_ptr channel)
{
    if (generation != generation_ || !std::holds_alternative<state::handshaking>(state_))
    {
        if (channel)
            channel->close();
        return;
    }

    if (ec || !channel)
    {
        auto err = error::channel(ec ? "handshake failed" : "handshake failed: no channel", ec);
        log_warning("session: {}", err.what());
        transition_to(state::idle{err});
        notify_waiters(err);
        return;
    }

    transition_to(state::connected{std::move(channel)});
    notify_waiters({});
}

// ============================================================================
// Transfer
// ============================================================================

void session::send_file(std::unique_ptr<std::istream> reader,
                        std::string file_name,
                        uint64_t declared_size,
                        std::shared_ptr<progress_queue> progress,
                        cancel_token cancel,
                        transfer_handler handler)
{
    if (auto err = check_connected("send_file"))
        return post_result(std::move(handler), std::move(*err));

    if (file_name.empty())
        return post_result(std::move(handler), error::generic("send_file: file name must not be empty"));

    if (!reader)
        return post_result(std::move(handler), error::generic("send_file: no source to read from"));

    auto relay = parse_relay_hint(config_.relay_url);
    if (!relay)
        return post_result(std::move(handler), relay.error());

    auto messages = std::make_shared<message_channel>(io_context_.get_executor(), take_channel());

    file_sender::parameters params{std::move(reader), std::move(file_name), declared_size, std::move(progress), std::move(cancel), relay.value(), transit_abilities::all(), transfer_};
    std::make_shared<file_sender>(io_context_, std::move(messages), std::move(params), std::move(handler))->start();
}

void session::request_file(cancel_token cancel, transfer_handler handler)
{
    if (auto err = check_connected("request_file"))
        return post_result(std::move(handler), std::move(*err));

    auto relay = parse_relay_hint(config_.relay_url);
    if (!relay)
        return post_result(std::move(handler), relay.error());

    auto messages = std::make_shared<message_channel>(io_context_.get_executor(), take_channel());

    offer_receiver::parameters params{std::move(cancel), relay.value(), transit_abilities::all()};
    auto receiver = std::make_shared<offer_receiver>(io_context_, std::move(messages), std::move(params),
        [wptr = weak_from_this(), handler = std::move(handler)](result<transfer_outcome> outcome, offer_ptr offer) {
            auto self = wptr.lock();
            if (offer && self && self->status() == session_status::consumed)
                self->pending_offer_ = std::move(offer);
            handler(std::move(outcome));
        });
    receiver->start();
}

std::optional<error> session::check_connected(const char* operation)
{
    if (auto* idle = std::get_if<state::idle>(&state_); idle && idle->last_failure)
    {
        auto err = std::move(*idle->last_failure);
        idle->last_failure.reset();
        return err;
    }

    switch (status())
    {
        case session_status::connected:
            return std::nullopt;
        case session_status::destroyed:
            return error::generic(fmt::format("{}: session was destroyed", operation));
        case session_status::consumed:
            return error::generic(fmt::format("{}: the secure channel was already used", operation));
        default:
            return error::generic(fmt::format("{}: no secure channel (session is {})", operation, to_string(status())));
    }
}

channel::channel_ptr session::take_channel()
{
    auto channel = std::move(std::get<state::connected>(state_).channel);
    transition_to(state::consumed{});
    return channel;
}

// ============================================================================
// Lifecycle
// ============================================================================

void session::destroy()
{
    if (std::holds_alternative<state::destroyed>(state_))
        return;

    release();
}

void session::release()
{
    ++generation_;

    if (auto* handshaking = std::get_if<state::handshaking>(&state_); handshaking && handshaking->handshake)
        handshaking->handshake->cancel();
    else if (auto* connected = std::get_if<state::connected>(&state_); connected && connected->channel)
        connected->channel->close();

    pending_offer_.reset();
    transition_to(state::destroyed{});
    notify_waiters(error::generic("session was destroyed"));
}

void session::transition_to(session_state next)
{
    auto from = status();
    state_ = std::move(next);
    log_info("session: {} -> {}", to_string(from), to_string(status()));
}

void session::notify_waiters(const result<void>& outcome)
{
    for (auto& waiter : std::exchange(waiters_, {}))
        post_result(std::move(waiter), outcome);
}

}  // namespace pylon

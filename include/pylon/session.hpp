#pragma once

#include <pylon/cancellation.hpp>
#include <pylon/channel/secure_channel.hpp>
#include <pylon/config.hpp>
#include <pylon/error.hpp>
#include <pylon/progress.hpp>
#include <pylon/session_state.hpp>
#include <pylon/transfer/received_offer.hpp>
#include <pylon/transfer/transfer_operation.hpp>

#include <utility>
#include <boost/asio.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pylon
{

// ============================================================================
// Session
// ============================================================================

// One wormhole: a code, a handshake, one secure channel and exactly one
// transfer over it. Every handler is posted to the io_context, never run from
// inside the call that started the operation. Not thread-safe; use the session
// from the io_context thread only.
class session : public std::enable_shared_from_this<session>
{
  public:
    using code_handler = std::function<void(result<std::string>)>;
    using connect_handler = std::function<void(result<void>)>;
    using transfer_handler = std::function<void(result<transfer_outcome>)>;

    session(boost::asio::io_context& io_context, channel::rendezvous_ptr rendezvous, app_config config = {}, transfer_config transfer = {});

    session(const session&) = delete;
    session& operator=(const session&) = delete;
    session(session&&) = delete;
    session& operator=(session&&) = delete;

    ~session();

    // Sender side: asks the rendezvous for a fresh code of code_length words and
    // starts the handshake on it. The handler gets the code.
    void generate_code(std::size_t code_length, code_handler handler);

    // Receiver side: joins the handshake the sender opened with code.
    void connect_with_code(std::string code, connect_handler handler);

    // Completes once the handshake resolved.
    void wait_connected(connect_handler handler);

    void send_file(std::unique_ptr<std::istream> reader,
                   std::string file_name,
                   uint64_t declared_size,
                   std::shared_ptr<progress_queue> progress,
                   cancel_token cancel,
                   transfer_handler handler);

    void request_file(cancel_token cancel, transfer_handler handler);

    // Offer received by the last request_file, if any.
    offer_ptr pending_offer() const
    {
        return pending_offer_;
    }

    // Releases the handshake, the channel and the pending offer. Later
    // operations fail. Safe to call more than once.
    void destroy();

    session_status status() const
    {
        return status_of(state_);
    }

    const std::string& code() const
    {
        return code_;
    }

    const std::string& motd() const
    {
        return motd_;
    }

    const app_config& config() const
    {
        return config_;
    }

    const transfer_config& transfer_settings() const
    {
        return transfer_;
    }

  private:
    // Precondition shared by generate_code and connect_with_code. The session
    // must be owned by a shared_ptr, as session_builder::build makes it.
    std::optional<error> check_idle(const char* operation) const;

    // Moves to handshaking and returns the generation the rendezvous reply belongs to.
    uint64_t begin_handshake(const char* role);

    // Stores the handshake the rendezvous handed out; the code on success.
    result<std::string> on_welcome(uint64_t generation, const boost::system::error_code& ec, channel::welcome welcome, channel::handshake_ptr handshake);
    void on_handshake(uint64_t generation, const boost::system::error_code& ec, channel::channel_ptr channel);

    // Precondition shared by send_file and request_file. Reports a remembered
    // handshake failure once.
    std::optional<error> check_connected(const char* operation);

    // Moves the established channel out; the session is consumed afterwards.
    channel::channel_ptr take_channel();

    void transition_to(session_state next);
    void notify_waiters(const result<void>& outcome);
    void release();

    template<typename Handler, typename Value>
    void post_result(Handler handler, Value value)
    {
        boost::asio::post(io_context_, [handler = std::move(handler), value = std::move(value)]() mutable { handler(std::move(value)); });
    }

    boost::asio::io_context& io_context_;
    channel::rendezvous_ptr rendezvous_;
    app_config config_;
    transfer_config transfer_;

    session_state state_;
    uint64_t generation_{0};
    std::string code_;
    std::string motd_;
    std::vector<connect_handler> waiters_;
    offer_ptr pending_offer_;
};

using session_ptr = std::shared_ptr<session>;

}  // namespace pylon

#pragma once

#include <pylon/config.hpp>

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pylon::channel
{

// ============================================================================
// Secure Channel
// ============================================================================

// Encrypted, ordered, message-oriented link to the peer, produced by a completed
// handshake. Completion handlers never run inside the initiating call.
class secure_channel
{
  public:
    using send_handler = std::function<void(const boost::system::error_code&)>;
    using receive_handler = std::function<void(const boost::system::error_code&, std::vector<uint8_t>)>;

    virtual ~secure_channel() = default;

    virtual void async_send(std::vector<uint8_t> message, send_handler handler) = 0;

    // At most one receive may be outstanding.
    virtual void async_receive(receive_handler handler) = 0;

    // Outstanding operations complete with operation_aborted, the peer sees peer_closed.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

using channel_ptr = std::shared_ptr<secure_channel>;

// ============================================================================
// Handshake
// ============================================================================

// In-flight key exchange that resolves into a secure channel.
class handshake
{
  public:
    using completion_handler = std::function<void(const boost::system::error_code&, channel_ptr)>;

    virtual ~handshake() = default;

    // One waiter. Completes right away (posted) when the handshake already resolved.
    virtual void async_wait(completion_handler handler) = 0;

    // Abandons the exchange; a waiting handler gets operation_aborted.
    virtual void cancel() = 0;
};

using handshake_ptr = std::shared_ptr<handshake>;

// ============================================================================
// Rendezvous Service
// ============================================================================

struct welcome
{
    std::string code;
    std::string motd;
};

class rendezvous_service
{
  public:
    using connect_handler = std::function<void(const boost::system::error_code&, welcome, handshake_ptr)>;

    virtual ~rendezvous_service() = default;

    // Allocates a fresh code of code_length words and opens the handshake on it.
    virtual void async_connect_without_code(const app_config& config, std::size_t code_length, connect_handler handler) = 0;

    // Joins the handshake the other side opened with code.
    virtual void async_connect_with_code(const app_config& config, const std::string& code, connect_handler handler) = 0;
};

using rendezvous_ptr = std::shared_ptr<rendezvous_service>;

}  // namespace pylon::channel

#pragma once

#include <pylon/channel/secure_channel.hpp>
#include <pylon/error.hpp>

#include <optional>
#include <variant>

namespace pylon
{

enum class session_status
{
    idle,
    handshaking,
    connected,
    consumed,
    destroyed
};

const char* to_string(session_status status) noexcept;

// ============================================================================
// Session States
// ============================================================================

namespace state
{

struct idle
{
    // Failure of the last handshake, reported once by the next send or request.
    std::optional<error> last_failure;

    static constexpr session_status status = session_status::idle;
};

struct handshaking
{
    // Empty while the rendezvous is still issuing the code.
    channel::handshake_ptr handshake;

    static constexpr session_status status = session_status::handshaking;
};

struct connected
{
    channel::channel_ptr channel;

    static constexpr session_status status = session_status::connected;
};

struct consumed
{
    static constexpr session_status status = session_status::consumed;
};

struct destroyed
{
    static constexpr session_status status = session_status::destroyed;
};

}  // namespace state

// At most one of handshake and channel exists at any time.
using session_state = std::variant<state::idle, state::handshaking, state::connected, state::consumed, state::destroyed>;

inline session_status status_of(const session_state& state)
{
    return std::visit([](const auto& s) { return s.status; }, state);
}

}  // namespace pylon

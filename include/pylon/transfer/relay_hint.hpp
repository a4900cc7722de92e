#pragma once

#include <pylon/error.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace pylon
{

// Where the transit relay of a session can be reached.
struct relay_hint
{
    std::string host;
    uint16_t port{0};

    // Canonical "tcp:host:port" form, IPv6 hosts bracketed.
    std::string to_string() const;

    bool operator==(const relay_hint&) const = default;
};

// Accepts "host:port", "tcp:host:port" and "tcp://host:port". Fails with
// errc::relay_address on anything else; never touches the network.
result<relay_hint> parse_relay_hint(std::string_view url);

}  // namespace pylon

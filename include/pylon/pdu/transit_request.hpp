#pragma once

#include <pylon/common.hpp>
#include <pylon/transfer/transit.hpp>

#include <string>

namespace pylon
{
// First message of each side: what it can do and where its relay lives.
struct transit_request
{
    transit_abilities abilities{transit_abilities::all()};
    std::string relay_hint{};

    bool operator==(const transit_request&) const = default;
};

namespace detail
{
inline auto message_id_of([[maybe_unused]] const transit_request& transit_request)
{
    return message_id::transit;
}

template<>
inline consteval auto members<transit_request>()
{
    using o = transit_request;
    return std::tuple{
        meta<enum_flag>(&o::abilities, "abilities"),
        meta<u16_octet_str<512>>(&o::relay_hint, "relay_hint")};
}
}  // namespace detail
}  // namespace pylon

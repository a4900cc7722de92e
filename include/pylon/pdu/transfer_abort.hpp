#pragma once

#include <pylon/common.hpp>

#include <string>

namespace pylon
{
struct transfer_abort
{
    std::string reason{};

    bool operator==(const transfer_abort&) const = default;
};

namespace detail
{
inline auto message_id_of([[maybe_unused]] const transfer_abort& transfer_abort)
{
    return message_id::abort;
}

template<>
inline consteval auto members<transfer_abort>()
{
    using o = transfer_abort;
    return std::tuple{meta<u16_octet_str<1024>>(&o::reason, "reason")};
}
}  // namespace detail
}  // namespace pylon

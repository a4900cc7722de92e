#pragma once

#include <pylon/common.hpp>

#include <cstdint>

namespace pylon
{
// Receiver's final word: how many bytes it wrote.
struct transfer_ack
{
    uint64_t bytes_received{0};

    bool operator==(const transfer_ack&) const = default;
};

namespace detail
{
inline auto message_id_of([[maybe_unused]] const transfer_ack& transfer_ack)
{
    return message_id::ack;
}

template<>
inline consteval auto members<transfer_ack>()
{
    using o = transfer_ack;
    return std::tuple{meta<u64>(&o::bytes_received, "bytes_received")};
}
}  // namespace detail
}  // namespace pylon

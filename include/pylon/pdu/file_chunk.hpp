#pragma once

#include <pylon/common.hpp>

#include <vector>

namespace pylon
{
struct file_chunk
{
    std::vector<uint8_t> data{};

    bool operator==(const file_chunk&) const = default;
};

namespace detail
{
inline auto message_id_of([[maybe_unused]] const file_chunk& file_chunk)
{
    return message_id::chunk;
}

template<>
inline consteval auto members<file_chunk>()
{
    using o = file_chunk;
    return std::tuple{meta<octets>(&o::data, "data")};
}
}  // namespace detail
}  // namespace pylon

#pragma once

#include <pylon/common.hpp>

#include <cstdint>
#include <string>

namespace pylon
{
struct file_offer
{
    std::string file_name{};
    uint64_t file_size{0};

    bool operator==(const file_offer&) const = default;
};

namespace detail
{
inline auto message_id_of([[maybe_unused]] const file_offer& file_offer)
{
    return message_id::offer;
}

template<>
inline consteval auto members<file_offer>()
{
    using o = file_offer;
    return std::tuple{
        meta<u16_octet_str<4096>>(&o::file_name, "file_name"),
        meta<u64>(&o::file_size, "file_size")};
}
}  // namespace detail
}  // namespace pylon

#pragma once

#include <pylon/common.hpp>

namespace pylon
{
struct offer_answer
{
    bool accepted{false};

    bool operator==(const offer_answer&) const = default;
};

namespace detail
{
inline auto message_id_of([[maybe_unused]] const offer_answer& offer_answer)
{
    return message_id::answer;
}

template<>
inline consteval auto members<offer_answer>()
{
    using o = offer_answer;
    return std::tuple{meta<boolean>(&o::accepted, "accepted")};
}
}  // namespace detail
}  // namespace pylon

#pragma once

#include <cstdint>
#include <string>

namespace pylon
{

// ============================================================================
// Transit Abilities
// ============================================================================

enum class transit_ability : uint8_t
{
    direct_tcp_v1 = 0x01,
    relay_v1 = 0x02,
    relay_v2 = 0x04,
};

// Set of ways a side is able to move file bytes. Both sides advertise theirs and
// the transfer runs over the intersection.
class transit_abilities
{
    uint8_t bits_{0};

    static constexpr uint8_t known_bits{0x07};

    explicit constexpr transit_abilities(uint8_t bits)
      : bits_(bits & known_bits)
    {
    }

  public:
    constexpr transit_abilities() = default;

    static constexpr transit_abilities all()
    {
        return transit_abilities{known_bits};
    }

    static constexpr transit_abilities none()
    {
        return transit_abilities{};
    }

    // Unknown bits from newer peers are dropped.
    static constexpr transit_abilities from_u8(uint8_t bits)
    {
        return transit_abilities{bits};
    }

    constexpr explicit operator uint8_t() const
    {
        return bits_;
    }

    constexpr transit_abilities with(transit_ability ability) const
    {
        return transit_abilities{static_cast<uint8_t>(bits_ | static_cast<uint8_t>(ability))};
    }

    constexpr bool contains(transit_ability ability) const
    {
        return (bits_ & static_cast<uint8_t>(ability)) != 0;
    }

    constexpr transit_abilities intersect(transit_abilities other) const
    {
        return transit_abilities{static_cast<uint8_t>(bits_ & other.bits_)};
    }

    constexpr bool empty() const
    {
        return bits_ == 0;
    }

    // "direct-tcp-v1,relay-v1" style listing for logs.
    std::string to_string() const
    {
        std::string out;
        auto append = [&](transit_ability ability, const char* name) {
            if (!contains(ability))
                return;
            if (!out.empty())
                out += ',';
            out += name;
        };
        append(transit_ability::direct_tcp_v1, "direct-tcp-v1");
        append(transit_ability::relay_v1, "relay-v1");
        append(transit_ability::relay_v2, "relay-v2");
        return out.empty() ? "none" : out;
    }

    constexpr bool operator==(const transit_abilities&) const = default;
};

}  // namespace pylon

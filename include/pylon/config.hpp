#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pylon
{

// ============================================================================
// Defaults
// ============================================================================

inline constexpr std::string_view default_app_id{"pylon.app/file-transfer"};
inline constexpr std::string_view default_rendezvous_url{"ws://relay.magic-wormhole.io:4000/v1"};
inline constexpr std::string_view default_relay_url{"tcp:transit.magic-wormhole.io:4001"};

inline constexpr std::size_t default_chunk_size{16 * 1024};
inline constexpr std::size_t max_chunk_size{1024 * 1024};

// ============================================================================
// Application Configuration
// ============================================================================

// Identity and endpoints used to bootstrap a session. The application id keeps
// this client's dialect apart from other clients sharing the rendezvous.
struct app_config
{
    std::string application_id{default_app_id};
    std::string rendezvous_url{default_rendezvous_url};
    std::string relay_url{default_relay_url};

    // Defaults overridden by PYLON_APP_ID, PYLON_RENDEZVOUS_URL and PYLON_RELAY_URL
    // when those are set and non-empty.
    static app_config from_env();

    bool is_valid() const
    {
        return !application_id.empty() && !rendezvous_url.empty();
    }

    bool operator==(const app_config&) const = default;
};

// ============================================================================
// Transfer Configuration
// ============================================================================

struct transfer_config
{
    std::size_t chunk_size{default_chunk_size};

    bool is_valid() const
    {
        return chunk_size > 0 && chunk_size <= max_chunk_size;
    }
};

} // namespace pylon

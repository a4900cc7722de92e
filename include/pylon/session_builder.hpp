#pragma once

#include <pylon/channel/secure_channel.hpp>
#include <pylon/config.hpp>
#include <pylon/session.hpp>

#include <utility>
#include <boost/asio.hpp>

#include <memory>
#include <stdexcept>
#include <string>

namespace pylon
{

// ============================================================================
// Session Builder
// ============================================================================

class session_builder
{
    app_config config_;
    transfer_config transfer_;

  public:
    session_builder& with_config(app_config config)
    {
        config_ = std::move(config);
        return *this;
    }

    session_builder& with_app_id(std::string app_id)
    {
        config_.application_id = std::move(app_id);
        return *this;
    }

    session_builder& with_rendezvous_url(std::string url)
    {
        config_.rendezvous_url = std::move(url);
        return *this;
    }

    session_builder& with_relay_url(std::string url)
    {
        config_.relay_url = std::move(url);
        return *this;
    }

    session_builder& with_chunk_size(std::size_t size)
    {
        transfer_.chunk_size = size;
        return *this;
    }

    session_ptr build(boost::asio::io_context& io, channel::rendezvous_ptr rendezvous)
    {
        if (!config_.is_valid())
            throw std::invalid_argument{"Invalid application configuration"};

        if (!transfer_.is_valid())
            throw std::invalid_argument{"Invalid transfer configuration"};

        if (!rendezvous)
            throw std::invalid_argument{"No rendezvous service"};

        return std::make_shared<session>(io, std::move(rendezvous), config_, transfer_);
    }
};

}  // namespace pylon

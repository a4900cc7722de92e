#pragma once

#include <pylon/channel/secure_channel.hpp>
#include <pylon/channel/channel_error.hpp>

#include <utility>
#include <boost/asio.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <utility>

namespace pylon::channel
{

class local_handshake;

// ============================================================================
// Local Rendezvous
// ============================================================================

// In-process rendezvous service. Both sides must run on the same io_context.
// Codes look like "7-guitar-sailboat"; the nameplate is the lowest number not in
// use by the same application id. A match hands both sides a linked pair of
// in-memory channels.
class local_rendezvous : public rendezvous_service, public std::enable_shared_from_this<local_rendezvous>
{
  public:
    explicit local_rendezvous(boost::asio::io_context& io_context, std::string url = std::string{default_rendezvous_url});

    local_rendezvous(const local_rendezvous&) = delete;
    local_rendezvous& operator=(const local_rendezvous&) = delete;
    local_rendezvous(local_rendezvous&&) = delete;
    local_rendezvous& operator=(local_rendezvous&&) = delete;
    ~local_rendezvous() override = default;

    void async_connect_without_code(const app_config& config, std::size_t code_length, connect_handler handler) override;

    void async_connect_with_code(const app_config& config, const std::string& code, connect_handler handler) override;

    const std::string& url() const
    {
        return url_;
    }

    void set_motd(std::string motd)
    {
        motd_ = std::move(motd);
    }

    // Nameplates with a side still waiting for its peer.
    std::size_t open_nameplates() const
    {
        return mailboxes_.size();
    }

    // Fixed seed for reproducible codes.
    void seed(uint32_t value)
    {
        rng_.seed(value);
    }

  private:
    friend class local_handshake;

    using mailbox_key = std::pair<std::string, uint32_t>;

    struct mailbox
    {
        std::string code;
        std::weak_ptr<local_handshake> creator;
        std::weak_ptr<local_handshake> joiner;
    };

    uint32_t allocate_nameplate(const std::string& app_id) const;
    std::string make_code(uint32_t nameplate, std::size_t code_length);
    void complete_exchange(const mailbox_key& key);
    void abandon(const mailbox_key& key, const local_handshake* side);
    void fail(connect_handler handler, errc error);

    boost::asio::io_context& io_context_;
    std::string url_;
    std::string motd_;
    std::mt19937 rng_;
    std::map<mailbox_key, mailbox> mailboxes_;
};

}  // namespace pylon::channel

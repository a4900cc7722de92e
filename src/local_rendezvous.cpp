#include <pylon/channel/local_rendezvous.hpp>
#include <pylon/channel/wordlist.hpp>
#include <pylon/common/helpers.hpp>
#include <pylon/logger.hpp>

#include <deque>

namespace pylon::channel
{

// ============================================================================
// Local Channel
// ============================================================================

namespace
{
class local_channel : public secure_channel
{
    boost::asio::io_context& io_context_;
    std::weak_ptr<local_channel> peer_;
    std::deque<std::vector<uint8_t>> inbox_;
    receive_handler pending_receive_;
    bool open_{true};
    bool peer_closed_{false};

  public:
    explicit local_channel(boost::asio::io_context& io_context)
      : io_context_(io_context)
    {
    }

    local_channel(const local_channel&) = delete;
    local_channel& operator=(const local_channel&) = delete;

    ~local_channel() override
    {
        close();
    }

    static std::pair<std::shared_ptr<local_channel>, std::shared_ptr<local_channel>> make_pair(boost::asio::io_context& io_context)
    {
        auto a = std::make_shared<local_channel>(io_context);
        auto b = std::make_shared<local_channel>(io_context);
        a->peer_ = b;
        b->peer_ = a;
        return {a, b};
    }

    void async_send(std::vector<uint8_t> message, send_handler handler) override
    {
        boost::system::error_code ec;
        auto peer = peer_.lock();

        if (!open_)
            ec = errc::channel_closed;
        else if (!peer || peer_closed_)
            ec = errc::peer_closed;
        else
            peer->deliver(std::move(message));

        boost::asio::post(io_context_, [handler = std::move(handler), ec] { handler(ec); });
    }

    void async_receive(receive_handler handler) override
    {
        boost::system::error_code ec;

        if (!open_)
            ec = errc::channel_closed;
        else if (pending_receive_)
            ec = boost::asio::error::already_started;
        else if (!inbox_.empty())
        {
            auto message = std::move(inbox_.front());
            inbox_.pop_front();
            boost::asio::post(io_context_, [handler = std::move(handler), message = std::move(message)]() mutable {
                handler({}, std::move(message));
            });
            return;
        }
        else if (peer_closed_)
            ec = errc::peer_closed;
        else
        {
            pending_receive_ = std::move(handler);
            return;
        }

        boost::asio::post(io_context_, [handler = std::move(handler), ec] { handler(ec, {}); });
    }

    void close() override
    {
        if (!open_)
            return;

        open_ = false;
        inbox_.clear();
        complete_receive(boost::asio::error::operation_aborted);

        if (auto peer = peer_.lock())
            peer->on_peer_closed();
        peer_.reset();
    }

    bool is_open() const override
    {
        return open_;
    }

  private:
    void deliver(std::vector<uint8_t> message)
    {
        if (!open_)
            return;

        if (pending_receive_)
        {
            auto handler = std::exchange(pending_receive_, nullptr);
            boost::asio::post(io_context_, [handler = std::move(handler), message = std::move(message)]() mutable {
                handler({}, std::move(message));
            });
            return;
        }

        inbox_.push_back(std::move(message));
    }

    void on_peer_closed()
    {
        peer_closed_ = true;
        complete_receive(errc::peer_closed);
    }

    void complete_receive(boost::system::error_code ec)
    {
        if (!pending_receive_)
            return;

        auto handler = std::exchange(pending_receive_, nullptr);
        boost::asio::post(io_context_, [handler = std::move(handler), ec] { handler(ec, {}); });
    }
};
}  // namespace

// ============================================================================
// Local Handshake
// ============================================================================

class local_handshake : public handshake, public std::enable_shared_from_this<local_handshake>
{
    boost::asio::io_context& io_context_;
    std::weak_ptr<local_rendezvous> service_;
    local_rendezvous::mailbox_key key_;
    bool resolved_{false};
    boost::system::error_code result_ec_;
    channel_ptr channel_;
    completion_handler waiter_;

  public:
    local_handshake(boost::asio::io_context& io_context, std::weak_ptr<local_rendezvous> service, local_rendezvous::mailbox_key key)
      : io_context_(io_context)
      , service_(std::move(service))
      , key_(std::move(key))
    {
    }

    void async_wait(completion_handler handler) override
    {
        if (waiter_)
        {
            boost::asio::post(io_context_, [handler = std::move(handler)] { handler(boost::asio::error::already_started, nullptr); });
            return;
        }

        waiter_ = std::move(handler);
        if (resolved_)
            notify();
    }

    void cancel() override
    {
        if (resolved_)
        {
            // Resolved but never collected: nobody else will close it.
            if (channel_)
                std::exchange(channel_, nullptr)->close();
            return;
        }

        if (auto service = service_.lock())
            service->abandon(key_, this);

        resolve(boost::asio::error::operation_aborted, nullptr);
    }

    void resolve(boost::system::error_code ec, channel_ptr channel)
    {
        if (resolved_)
            return;

        resolved_ = true;
        result_ec_ = ec;
        channel_ = std::move(channel);

        if (waiter_)
            notify();
    }

    bool is_resolved() const
    {
        return resolved_;
    }

  private:
    void notify()
    {
        auto handler = std::exchange(waiter_, nullptr);
        boost::asio::post(io_context_, [handler = std::move(handler), ec = result_ec_, channel = std::exchange(channel_, nullptr)] {
            handler(ec, channel);
        });
    }
};

// ============================================================================
// Local Rendezvous
// ============================================================================

local_rendezvous::local_rendezvous(boost::asio::io_context& io_context, std::string url)
  : io_context_(io_context)
  , url_(std::move(url))
  , rng_(std::random_device{}())
{
}

void local_rendezvous::async_connect_without_code(const app_config& config, std::size_t code_length, connect_handler handler)
{
    if (config.rendezvous_url != url_)
        return fail(std::move(handler), errc::rendezvous_unreachable);

    if (code_length == 0)
        return fail(std::move(handler), errc::invalid_code);

    auto nameplate = allocate_nameplate(config.application_id);
    mailbox_key key{config.application_id, nameplate};

    auto side = std::make_shared<local_handshake>(io_context_, weak_from_this(), key);
    auto code = make_code(nameplate, code_length);
    mailboxes_[key] = mailbox{code, side, {}};

    log_debug("rendezvous: allocated nameplate {} for {}", nameplate, config.application_id);

    boost::asio::post(io_context_, [handler = std::move(handler), w = welcome{code, motd_}, side]() mutable {
        handler({}, std::move(w), side);
    });
}

void local_rendezvous::async_connect_with_code(const app_config& config, const std::string& code, connect_handler handler)
{
    if (config.rendezvous_url != url_)
        return fail(std::move(handler), errc::rendezvous_unreachable);

    auto parts = split(code, '-');
    if (parts.size() < 2)
        return fail(std::move(handler), errc::invalid_code);

    for (const auto& word : parts)
    {
        if (word.empty())
            return fail(std::move(handler), errc::invalid_code);
    }

    auto nameplate = parse_port(parts.front());  // any 1..65535 number
    if (!nameplate)
        return fail(std::move(handler), errc::invalid_code);

    mailbox_key key{config.application_id, *nameplate};
    auto it = mailboxes_.find(key);
    if (it == mailboxes_.end() || it->second.creator.expired())
    {
        if (it != mailboxes_.end())
            mailboxes_.erase(it);
        return fail(std::move(handler), errc::nameplate_unknown);
    }

    if (!it->second.joiner.expired())
        return fail(std::move(handler), errc::nameplate_crowded);

    auto side = std::make_shared<local_handshake>(io_context_, weak_from_this(), key);
    it->second.joiner = side;

    boost::asio::post(io_context_, [handler = std::move(handler), w = welcome{code, motd_}, side]() mutable {
        handler({}, std::move(w), side);
    });

    boost::asio::post(io_context_, [wptr = weak_from_this(), key, code] {
        auto self = wptr.lock();
        if (!self)
            return;

        auto found = self->mailboxes_.find(key);
        if (found == self->mailboxes_.end())
            return;

        // The joiner's words take part in the exchange.
        auto joiner = found->second.joiner.lock();
        if (!joiner)
            return;

        if (found->second.code != code)
        {
            auto creator = found->second.creator.lock();
            self->mailboxes_.erase(found);
            log_warning("rendezvous: key confirmation failed on nameplate {}", key.second);
            joiner->resolve(errc::key_mismatch, nullptr);
            if (creator)
                creator->resolve(errc::key_mismatch, nullptr);
            return;
        }

        self->complete_exchange(key);
    });
}

uint32_t local_rendezvous::allocate_nameplate(const std::string& app_id) const
{
    uint32_t nameplate = 1;
    for (auto it = mailboxes_.lower_bound({app_id, 1}); it != mailboxes_.end() && it->first.first == app_id; ++it)
    {
        if (it->first.second != nameplate)
            break;
        ++nameplate;
    }
    return nameplate;
}

std::string local_rendezvous::make_code(uint32_t nameplate, std::size_t code_length)
{
    auto words = code_words();
    std::uniform_int_distribution<std::size_t> pick(0, words.size() - 1);

    auto code = std::to_string(nameplate);
    for (std::size_t i = 0; i < code_length; ++i)
    {
        code += '-';
        code += words[pick(rng_)];
    }
    return code;
}

void local_rendezvous::complete_exchange(const mailbox_key& key)
{
    auto it = mailboxes_.find(key);
    if (it == mailboxes_.end())
        return;

    auto creator = it->second.creator.lock();
    auto joiner = it->second.joiner.lock();
    mailboxes_.erase(it);

    if (!creator || !joiner)
    {
        if (creator)
            creator->resolve(errc::peer_closed, nullptr);
        if (joiner)
            joiner->resolve(errc::peer_closed, nullptr);
        return;
    }

    auto [a, b] = local_channel::make_pair(io_context_);
    log_debug("rendezvous: nameplate {} matched, channel established", key.second);
    creator->resolve({}, a);
    joiner->resolve({}, b);
}

void local_rendezvous::abandon(const mailbox_key& key, const local_handshake* side)
{
    auto it = mailboxes_.find(key);
    if (it == mailboxes_.end())
        return;

    auto creator = it->second.creator.lock();
    if (creator.get() == side || !creator)
    {
        auto joiner = it->second.joiner.lock();
        mailboxes_.erase(it);
        if (joiner)
            joiner->resolve(errc::peer_closed, nullptr);
        return;
    }

    // A joiner walking away reopens the nameplate.
    if (it->second.joiner.lock().get() == side)
        it->second.joiner.reset();
}

void local_rendezvous::fail(connect_handler handler, errc error)
{
    boost::asio::post(io_context_, [handler = std::move(handler), error] {
        handler(error, {}, nullptr);
    });
}

}  // namespace pylon::channel

#include <pylon/channel/channel_error.hpp>

namespace pylon::channel
{

namespace
{
class category : public boost::system::error_category
{
  public:
    const char* name() const noexcept override
    {
        return "pylon.channel";
    }

    std::string message(int val) const override
    {
        switch (static_cast<errc>(val))
        {
            case errc::rendezvous_unreachable:
                return "Rendezvous server unreachable";
            case errc::invalid_code:
                return "Malformed wormhole code";
            case errc::nameplate_unknown:
                return "Nobody is waiting on this wormhole code";
            case errc::nameplate_crowded:
                return "Wormhole code is already in use by two sides";
            case errc::key_mismatch:
                return "Key confirmation failed, the codes did not match";
            case errc::peer_closed:
                return "Peer closed the channel";
            case errc::channel_closed:
                return "Channel is closed";
        }
        return "Unknown channel error";
    }
};
}  // namespace

const boost::system::error_category& channel_category() noexcept
{
    static const category inst;
    return inst;
}

boost::system::error_code make_error_code(errc e) noexcept
{
    return {static_cast<int>(e), channel_category()};
}

}  // namespace pylon::channel

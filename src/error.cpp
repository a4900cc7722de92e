#include <pylon/error.hpp>

#include <fmt/core.h>

namespace pylon
{

namespace
{
class category : public boost::system::error_category
{
  public:
    const char* name() const noexcept override
    {
        return "pylon";
    }

    std::string message(int val) const override
    {
        switch (static_cast<errc>(val))
        {
            case errc::codegen:
                return "Error generating wormhole code";
            case errc::relay_address:
                return "Invalid relay address";
            case errc::transfer:
                return "File transfer failed";
            case errc::channel:
                return "An internal error occurred";
            case errc::generic:
                return "An error occurred";
        }
        return "Unknown pylon error";
    }
};
}  // namespace

const boost::system::error_category& pylon_category() noexcept
{
    static const category inst;
    return inst;
}

boost::system::error_code make_error_code(errc e) noexcept
{
    return {static_cast<int>(e), pylon_category()};
}

const char* to_string(errc e) noexcept
{
    switch (e)
    {
        case errc::codegen:
            return "codegen";
        case errc::relay_address:
            return "relay_address";
        case errc::transfer:
            return "transfer";
        case errc::channel:
            return "channel";
        case errc::generic:
            return "generic";
    }
    return "unknown";
}

std::string error::what() const
{
    auto text = fmt::format("{}: {}", code().message(), message_);
    if (cause_)
        text += fmt::format(" ({})", cause_.message());
    return text;
}

}  // namespace pylon

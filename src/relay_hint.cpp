#include <pylon/transfer/relay_hint.hpp>
#include <pylon/common/helpers.hpp>

#include <boost/asio/ip/address.hpp>
#include <fmt/core.h>

#include <algorithm>

namespace pylon
{

namespace
{
constexpr std::size_t max_host_length{253};

bool is_dns_label_char(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
}

bool is_valid_dns_name(std::string_view host)
{
    if (host.empty() || host.size() > max_host_length)
        return false;

    std::size_t label_start = 0;
    while (label_start <= host.size())
    {
        auto dot = host.find('.', label_start);
        auto label = host.substr(label_start, dot == std::string_view::npos ? std::string_view::npos : dot - label_start);

        if (label.empty() || label.size() > 63)
            return false;
        if (label.front() == '-' || label.back() == '-')
            return false;
        if (!std::all_of(label.begin(), label.end(), is_dns_label_char))
            return false;

        if (dot == std::string_view::npos)
            break;
        label_start = dot + 1;
    }
    return true;
}

bool looks_numeric(std::string_view host)
{
    return std::all_of(host.begin(), host.end(), [](char c) { return (c >= '0' && c <= '9') || c == '.'; });
}

error bad_relay(std::string_view url, std::string_view reason)
{
    return error::relay_address(fmt::format("'{}': {}", url, reason));
}
}  // namespace

std::string relay_hint::to_string() const
{
    if (host.find(':') != std::string::npos)
        return fmt::format("tcp:[{}]:{}", host, port);
    return fmt::format("tcp:{}:{}", host, port);
}

result<relay_hint> parse_relay_hint(std::string_view url)
{
    if (url.empty())
        return bad_relay(url, "relay URL is empty");

    auto rest = url;
    if (starts_with(rest, "tcp://"))
        rest.remove_prefix(6);
    else if (starts_with(rest, "tcp:"))
    {
        // tcp:4000 would otherwise read as host "tcp".
        if (rest.find(':', 4) == std::string_view::npos)
            return bad_relay(url, "expected tcp:host:port");
        rest.remove_prefix(4);
    }
    else if (rest.find("://") != std::string_view::npos)
        return bad_relay(url, "only tcp relays are supported");

    if (!rest.empty() && rest.back() == '/')
        rest.remove_suffix(1);

    relay_hint hint;
    std::string_view port_part;

    if (starts_with(rest, "["))
    {
        auto close = rest.find(']');
        if (close == std::string_view::npos || close + 1 >= rest.size() || rest[close + 1] != ':')
            return bad_relay(url, "malformed IPv6 host");

        auto host = rest.substr(1, close - 1);
        if (host.empty())
            return bad_relay(url, "empty host");

        boost::system::error_code ec;
        boost::asio::ip::make_address_v6(std::string{host}, ec);
        if (ec)
            return bad_relay(url, "invalid IPv6 address");

        hint.host = std::string{host};
        port_part = rest.substr(close + 2);
    }
    else
    {
        auto colon = rest.rfind(':');
        if (colon == std::string_view::npos)
            return bad_relay(url, "missing port");

        auto host = rest.substr(0, colon);
        if (host.empty())
            return bad_relay(url, "empty host");
        if (host.find(':') != std::string_view::npos)
            return bad_relay(url, "IPv6 hosts must be bracketed");

        if (looks_numeric(host))
        {
            boost::system::error_code ec;
            boost::asio::ip::make_address_v4(std::string{host}, ec);
            if (ec)
                return bad_relay(url, "invalid IPv4 address");
        }
        else if (!is_valid_dns_name(host))
        {
            return bad_relay(url, "invalid host name");
        }

        hint.host = std::string{host};
        port_part = rest.substr(colon + 1);
    }

    auto port = parse_port(port_part);
    if (!port)
        return bad_relay(url, "port must be a number in 1..65535");

    hint.port = *port;
    return hint;
}

}  // namespace pylon

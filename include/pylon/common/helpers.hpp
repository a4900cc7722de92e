#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace pylon
{
inline std::vector<std::string> split(const std::string& s, char delimiter)
{
    std::vector<std::string> tokens{};
    std::string token;
    std::istringstream tokenStream(s);
    while (std::getline(tokenStream, token, delimiter))
    {
        tokens.push_back(token);
    }
    return tokens;
}

inline bool starts_with(std::string_view s, std::string_view prefix)
{
    return s.substr(0, prefix.size()) == prefix;
}

// Decimal TCP port in 1..65535, nothing else.
inline std::optional<uint16_t> parse_port(std::string_view s)
{
    if (s.empty() || s.size() > 5)
        return std::nullopt;

    uint32_t port = 0;
    for (auto c : s)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        port = port * 10 + static_cast<uint32_t>(c - '0');
    }

    if (port == 0 || port > 65535)
        return std::nullopt;

    return static_cast<uint16_t>(port);
}
}  // namespace pylon

#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <boost/asio/ip/udp.hpp>

namespace utils
{
inline constexpr uint16_t MIN_RANDOM_PORT = 1024;
inline constexpr uint16_t MAX_RANDOM_PORT = 65535;

inline bool isBlank(const std::string& value)
{
    for (unsigned char c : value)
    {
        if (!std::isspace(c))
            return false;
    }
    return true;
}

inline std::string trim(const std::string& value)
{
    std::size_t first = 0;
    while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first])))
        ++first;

    std::size_t last = value.size();
    while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1])))
        --last;

    return value.substr(first, last - first);
}

// Decimal integer with an optional sign and nothing else, limited to the 32-bit range
inline std::optional<long long> parseInteger(const std::string& text)
{
    std::size_t i = 0;
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-'))
    {
        negative = text[i] == '-';
        ++i;
    }

    if (i == text.size())
        return std::nullopt;

    const long long limit = negative
        ? -static_cast<long long>(std::numeric_limits<int32_t>::min())
        : std::numeric_limits<int32_t>::max();

    long long value = 0;
    for (; i < text.size(); ++i)
    {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c))
            return std::nullopt;

        value = value * 10 + (c - '0');
        if (value > limit)
            return std::nullopt;
    }

    return negative ? -value : value;
}

inline std::string endpointToString(const boost::asio::ip::udp::endpoint& endpoint)
{
    if (endpoint.address().is_v6())
        return "[" + endpoint.address().to_string() + "]:" + std::to_string(endpoint.port());
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

// Uniform in [MIN_RANDOM_PORT, MAX_RANDOM_PORT]
uint16_t randomPortNumber();

std::array<uint8_t, 12> randomTransactionId();
}

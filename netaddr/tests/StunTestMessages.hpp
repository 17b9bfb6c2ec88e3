#pragma once
#include "StunMessage.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <boost/asio.hpp>

// Builders for hand-made STUN responses
namespace stuntest
{
inline void put16(std::vector<uint8_t>& out, uint16_t value)
{
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline std::vector<uint8_t> header(uint16_t type, const TransactionId& transactionId)
{
    std::vector<uint8_t> message;
    put16(message, type);
    put16(message, 0);
    put16(message, static_cast<uint16_t>(StunConstants::MAGIC_COOKIE >> 16));
    put16(message, static_cast<uint16_t>(StunConstants::MAGIC_COOKIE & 0xFFFF));
    message.insert(message.end(), transactionId.begin(), transactionId.end());
    return message;
}

// Appends a padded attribute and updates the message length
inline void appendAttribute(std::vector<uint8_t>& message, uint16_t type, const std::vector<uint8_t>& value)
{
    put16(message, type);
    put16(message, static_cast<uint16_t>(value.size()));
    message.insert(message.end(), value.begin(), value.end());
    while (message.size() % 4 != 0)
        message.push_back(0);

    uint16_t length = static_cast<uint16_t>(message.size() - StunConstants::HEADER_SIZE);
    message[2] = static_cast<uint8_t>(length >> 8);
    message[3] = static_cast<uint8_t>(length & 0xFF);
}

inline std::vector<uint8_t> addressValue(const boost::asio::ip::udp::endpoint& endpoint, bool xored,
                                         const TransactionId& transactionId)
{
    std::vector<uint8_t> value{0};
    uint16_t port = endpoint.port();
    if (xored)
        port ^= static_cast<uint16_t>(StunConstants::MAGIC_COOKIE >> 16);

    std::vector<uint8_t> mask{0x21, 0x12, 0xA4, 0x42};
    mask.insert(mask.end(), transactionId.begin(), transactionId.end());

    if (endpoint.address().is_v4())
    {
        value.push_back(StunConstants::FAMILY_IPV4);
        put16(value, port);
        auto bytes = endpoint.address().to_v4().to_bytes();
        for (std::size_t i = 0; i < bytes.size(); ++i)
            value.push_back(xored ? bytes[i] ^ mask[i] : bytes[i]);
    }
    else
    {
        value.push_back(StunConstants::FAMILY_IPV6);
        put16(value, port);
        auto bytes = endpoint.address().to_v6().to_bytes();
        for (std::size_t i = 0; i < bytes.size(); ++i)
            value.push_back(xored ? bytes[i] ^ mask[i] : bytes[i]);
    }
    return value;
}

inline std::vector<uint8_t> successResponse(const TransactionId& transactionId,
                                            const boost::asio::ip::udp::endpoint& mapped)
{
    auto message = header(StunConstants::BINDING_SUCCESS_RESPONSE, transactionId);
    appendAttribute(message, StunConstants::ATTR_XOR_MAPPED_ADDRESS, addressValue(mapped, true, transactionId));
    return message;
}

inline std::vector<uint8_t> errorResponse(const TransactionId& transactionId, int code, const std::string& reason)
{
    auto message = header(StunConstants::BINDING_ERROR_RESPONSE, transactionId);
    std::vector<uint8_t> value{0, 0, static_cast<uint8_t>(code / 100), static_cast<uint8_t>(code % 100)};
    value.insert(value.end(), reason.begin(), reason.end());
    appendAttribute(message, StunConstants::ATTR_ERROR_CODE, value);
    return message;
}

inline boost::asio::ip::udp::endpoint endpoint(const std::string& ip, uint16_t port)
{
    return boost::asio::ip::udp::endpoint(boost::asio::ip::make_address(ip), port);
}
}

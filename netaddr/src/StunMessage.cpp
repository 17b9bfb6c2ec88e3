#include "StunMessage.hpp"
#include <algorithm>
#include <optional>

using boost::asio::ip::udp;

namespace
{
uint16_t read16(const uint8_t* p)
{
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t read32(const uint8_t* p)
{
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

bool matchesTransaction(const uint8_t* data, const TransactionId& transactionId)
{
    for (std::size_t i = 0; i < transactionId.size(); ++i)
    {
        if (data[8 + i] != transactionId[i])
            return false;
    }
    return true;
}
}

std::vector<uint8_t> StunMessage::bindingRequest(const TransactionId& transactionId)
{
    using namespace StunConstants;
    std::vector<uint8_t> request(HEADER_SIZE, 0);
    request[0] = static_cast<uint8_t>(BINDING_REQUEST >> 8);
    request[1] = static_cast<uint8_t>(BINDING_REQUEST & 0xFF);
    // Bytes 2..3 message length, no attributes
    request[4] = static_cast<uint8_t>(MAGIC_COOKIE >> 24);
    request[5] = static_cast<uint8_t>(MAGIC_COOKIE >> 16);
    request[6] = static_cast<uint8_t>(MAGIC_COOKIE >> 8);
    request[7] = static_cast<uint8_t>(MAGIC_COOKIE);
    std::copy(transactionId.begin(), transactionId.end(), request.begin() + 8);
    return request;
}

bool StunMessage::isResponseTo(const uint8_t* data, std::size_t length, const TransactionId& transactionId)
{
    using namespace StunConstants;
    if (length < HEADER_SIZE || (data[0] & 0xC0) != 0)
        return false;

    uint16_t type = read16(data);
    if (type != BINDING_SUCCESS_RESPONSE && type != BINDING_ERROR_RESPONSE)
        return false;

    return read32(data + 4) == MAGIC_COOKIE && matchesTransaction(data, transactionId);
}

udp::endpoint StunMessage::parseBindingResponse(
    const uint8_t* data, std::size_t length, const TransactionId& transactionId)
{
    using namespace StunConstants;

    if (length < HEADER_SIZE)
        throw StunException("STUN response too short (" + std::to_string(length) + " bytes)");

    if ((data[0] & 0xC0) != 0 || read32(data + 4) != MAGIC_COOKIE)
        throw StunException("Datagram is not a STUN message");

    uint16_t messageLength = read16(data + 2);
    if (messageLength % 4 != 0)
        throw StunException("STUN message length is not a multiple of 4");
    if (HEADER_SIZE + messageLength > length)
        throw StunException("STUN message length exceeds received size");

    if (!matchesTransaction(data, transactionId))
        throw StunException("STUN response belongs to another transaction");

    uint16_t type = read16(data);
    if (type != BINDING_SUCCESS_RESPONSE && type != BINDING_ERROR_RESPONSE)
        throw StunException("Unexpected STUN message type " + std::to_string(type));

    std::optional<udp::endpoint> xorMapped;
    std::optional<udp::endpoint> legacyXorMapped;
    std::optional<udp::endpoint> mapped;

    const std::size_t end = HEADER_SIZE + messageLength;
    std::size_t i = HEADER_SIZE;
    while (i + 4 <= end)
    {
        uint16_t attrType = read16(data + i);
        uint16_t attrLength = read16(data + i + 2);
        const uint8_t* value = data + i + 4;
        if (i + 4 + attrLength > end)
            throw StunException("STUN attribute overruns the message");

        switch (attrType)
        {
            case ATTR_ERROR_CODE:
                if (type == BINDING_ERROR_RESPONSE)
                    throw decodeError(value, attrLength);
                break;
            case ATTR_XOR_MAPPED_ADDRESS:
                xorMapped = decodeAddress(value, attrLength, true, transactionId);
                break;
            case ATTR_XOR_MAPPED_ADDRESS_LEGACY:
                legacyXorMapped = decodeAddress(value, attrLength, true, transactionId);
                break;
            case ATTR_MAPPED_ADDRESS:
                mapped = decodeAddress(value, attrLength, false, transactionId);
                break;
            default:
                break;
        }

        // Attributes are padded to 4 bytes
        i += 4 + ((attrLength + 3u) & ~3u);
    }

    if (type == BINDING_ERROR_RESPONSE)
        throw StunException("STUN binding error response without ERROR-CODE");

    if (xorMapped)
        return *xorMapped;
    if (legacyXorMapped)
        return *legacyXorMapped;
    if (mapped)
        return *mapped;

    throw StunException("STUN response carries no mapped address");
}

udp::endpoint StunMessage::decodeAddress(
    const uint8_t* value, uint16_t length, bool xored, const TransactionId& transactionId)
{
    using namespace StunConstants;
    if (length < 4)
        throw StunException("STUN address attribute too short");

    uint8_t family = value[1];
    uint16_t port = read16(value + 2);
    if (xored)
        port ^= static_cast<uint16_t>(MAGIC_COOKIE >> 16);

    if (family == FAMILY_IPV4)
    {
        if (length < 8)
            throw StunException("STUN IPv4 address attribute too short");

        uint32_t raw = read32(value + 4);
        if (xored)
            raw ^= MAGIC_COOKIE;
        return udp::endpoint(boost::asio::ip::address_v4(raw), port);
    }

    if (family == FAMILY_IPV6)
    {
        if (length < 20)
            throw StunException("STUN IPv6 address attribute too short");

        boost::asio::ip::address_v6::bytes_type bytes;
        std::copy(value + 4, value + 20, bytes.begin());
        if (xored)
        {
            // Mask is the magic cookie followed by the transaction id
            std::array<uint8_t, 16> mask{};
            mask[0] = static_cast<uint8_t>(MAGIC_COOKIE >> 24);
            mask[1] = static_cast<uint8_t>(MAGIC_COOKIE >> 16);
            mask[2] = static_cast<uint8_t>(MAGIC_COOKIE >> 8);
            mask[3] = static_cast<uint8_t>(MAGIC_COOKIE);
            std::copy(transactionId.begin(), transactionId.end(), mask.begin() + 4);
            for (std::size_t b = 0; b < bytes.size(); ++b)
                bytes[b] ^= mask[b];
        }
        return udp::endpoint(boost::asio::ip::address_v6(bytes), port);
    }

    throw StunException("Unknown STUN address family " + std::to_string(family));
}

StunException StunMessage::decodeError(const uint8_t* value, uint16_t length)
{
    if (length < 4)
        return StunException("STUN binding error response with a truncated ERROR-CODE");

    int code = (value[2] & 0x07) * 100 + value[3];
    std::string reason(reinterpret_cast<const char*>(value + 4), length - 4);
    return StunException("STUN server answered " + std::to_string(code) + " " + reason, code);
}

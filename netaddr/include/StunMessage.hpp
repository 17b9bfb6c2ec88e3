#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio/ip/udp.hpp>

// RFC 5389 constants
namespace StunConstants
{
inline constexpr std::size_t HEADER_SIZE = 20;
inline constexpr uint32_t MAGIC_COOKIE = 0x2112A442;

inline constexpr uint16_t BINDING_REQUEST = 0x0001;
inline constexpr uint16_t BINDING_SUCCESS_RESPONSE = 0x0101;
inline constexpr uint16_t BINDING_ERROR_RESPONSE = 0x0111;

inline constexpr uint16_t ATTR_MAPPED_ADDRESS = 0x0001;
inline constexpr uint16_t ATTR_ERROR_CODE = 0x0009;
inline constexpr uint16_t ATTR_XOR_MAPPED_ADDRESS = 0x0020;
// Pre-RFC servers (vovida, stun4j era) still send this code point
inline constexpr uint16_t ATTR_XOR_MAPPED_ADDRESS_LEGACY = 0x8020;

inline constexpr uint8_t FAMILY_IPV4 = 0x01;
inline constexpr uint8_t FAMILY_IPV6 = 0x02;
}

class StunException : public std::runtime_error
{
public:
    explicit StunException(const std::string& message, int errorCode = 0)
        : std::runtime_error(message)
        , errorCode(errorCode)
    {}

    // STUN ERROR-CODE (class * 100 + number), 0 for local failures
    int getErrorCode() const { return errorCode; }

private:
    int errorCode;
};

using TransactionId = std::array<uint8_t, 12>;

class StunMessage
{
public:
    static std::vector<uint8_t> bindingRequest(const TransactionId& transactionId);

    // Cheap check used to drop stray datagrams before full parsing
    static bool isResponseTo(const uint8_t* data, std::size_t length, const TransactionId& transactionId);

    /**
     * Decodes a binding response and returns the mapped endpoint.
     * XOR-MAPPED-ADDRESS wins over MAPPED-ADDRESS when both are present.
     * Throws StunException for malformed messages, foreign transactions,
     * error responses (with the server's error code) and responses
     * without any mapped address.
     */
    static boost::asio::ip::udp::endpoint parseBindingResponse(
        const uint8_t* data, std::size_t length, const TransactionId& transactionId);

private:
    static boost::asio::ip::udp::endpoint decodeAddress(
        const uint8_t* value, uint16_t length, bool xored, const TransactionId& transactionId);
    static StunException decodeError(const uint8_t* value, uint16_t length);
};

#include "Utils.hpp"
#include <stdexcept>
#include <sodium/core.h>
#include <sodium/randombytes.h>

namespace
{
void ensureSodium()
{
    // sodium_init is idempotent and thread safe, 1 means already initialized
    static const int status = sodium_init();
    if (status < 0)
        throw std::runtime_error("libsodium could not be initialized");
}
}

namespace utils
{
uint16_t randomPortNumber()
{
    ensureSodium();
    const uint32_t span = static_cast<uint32_t>(MAX_RANDOM_PORT) - MIN_RANDOM_PORT + 1;
    return static_cast<uint16_t>(MIN_RANDOM_PORT + randombytes_uniform(span));
}

std::array<uint8_t, 12> randomTransactionId()
{
    ensureSodium();
    std::array<uint8_t, 12> id{};
    randombytes_buf(id.data(), id.size());
    return id;
}
}

#include "StunConfigValidator.hpp"
#include "Utils.hpp"

namespace
{
bool isAsciiAlphanumeric(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool isBracketed(const std::string& host)
{
    return host.size() > 2 && host.front() == '[' && host.back() == ']';
}
}

ChangeVerdict StunConfigValidator::validateStunServerAddress(const std::optional<std::string>& value)
{
    if (!value || utils::isBlank(*value))
        return ChangeVerdict::accept();

    std::string host = *value;
    bool ipv6Expected = false;
    if (host.front() == '[')
    {
        if (!isBracketed(host))
            return ChangeVerdict::reject("Invalid address string " + host);

        host = host.substr(1, host.size() - 2);
        ipv6Expected = true;
    }

    for (char c : host)
    {
        if (isAsciiAlphanumeric(c))
            continue;

        if ((c != '.' && c != ':') || (c == '.' && ipv6Expected) || (c == ':' && !ipv6Expected))
            return ChangeVerdict::reject(host + " is not a valid address nor host name");
    }

    return ChangeVerdict::accept();
}

ChangeVerdict StunConfigValidator::validateStunServerPort(const std::optional<std::string>& value)
{
    if (!value || utils::isBlank(*value))
        return ChangeVerdict::accept();

    auto port = utils::parseInteger(*value);
    if (!port)
        return ChangeVerdict::reject(*value + " is not a valid port!");

    if (*port < 1 || *port > 65535)
        return ChangeVerdict::reject(*value + " is outside the port range 1-65535");

    return ChangeVerdict::accept();
}

ChangeVerdict StunConfigValidator::validate(const std::string& key, const std::optional<std::string>& value)
{
    if (key == ConfigKeys::STUN_SERVER_ADDRESS)
        return validateStunServerAddress(value);
    if (key == ConfigKeys::STUN_SERVER_PORT)
        return validateStunServerPort(value);
    return ChangeVerdict::accept();
}

std::optional<StunServerConfig> StunConfigValidator::parseStunServerConfig(
    const std::optional<std::string>& host, const std::optional<std::string>& port)
{
    if (!host || !port || utils::isBlank(*host) || utils::isBlank(*port))
        return std::nullopt;

    if (!validateStunServerAddress(host) || !validateStunServerPort(port))
        return std::nullopt;

    std::string hostName = *host;
    if (isBracketed(hostName))
        hostName = hostName.substr(1, hostName.size() - 2);

    return StunServerConfig{hostName, static_cast<uint16_t>(*utils::parseInteger(*port))};
}

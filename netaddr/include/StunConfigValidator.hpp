#pragma once
#include "ConfigurationService.hpp"
#include "StunClient.hpp"
#include <optional>
#include <string>

// Checks proposed STUN server settings before they are committed.
// Accepting a value does not apply it, only a later start() re-reads it.
class StunConfigValidator
{
public:
    // Host name, dotted IPv4 literal or bracketed IPv6 literal.
    // Missing or blank values are accepted and turn STUN off.
    static ChangeVerdict validateStunServerAddress(const std::optional<std::string>& value);

    // Decimal integer in [1, 65535], missing or blank turns STUN off
    static ChangeVerdict validateStunServerPort(const std::optional<std::string>& value);

    // Keys other than the STUN server ones are always accepted
    static ChangeVerdict validate(const std::string& key, const std::optional<std::string>& value);

    // nullopt when either value is missing, blank or invalid. Brackets are
    // stripped from IPv6 literals.
    static std::optional<StunServerConfig> parseStunServerConfig(
        const std::optional<std::string>& host, const std::optional<std::string>& port);
};

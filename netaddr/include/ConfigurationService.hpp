#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace ConfigKeys
{
inline constexpr const char* STUN_SERVER_ADDRESS = "STUN_SERVER_ADDRESS";
inline constexpr const char* STUN_SERVER_PORT = "STUN_SERVER_PORT";
inline constexpr const char* BIND_RETRIES = "BIND_RETRIES";
inline constexpr const char* PREFERRED_NETWORK_ADDRESS = "PREFERRED_NETWORK_ADDRESS";
}

// Outcome of a proposed property change
struct ChangeVerdict
{
    bool accepted = true;
    std::string reason;

    static ChangeVerdict accept() { return ChangeVerdict{true, {}}; }
    static ChangeVerdict reject(std::string reason) { return ChangeVerdict{false, std::move(reason)}; }

    explicit operator bool() const { return accepted; }
};

// Key/value configuration the address manager reads from. Vetoable change
// listeners run synchronously before a commit, a rejection aborts it and
// the old value is kept.
class ConfigurationService
{
public:
    using ListenerId = uint64_t;
    using VetoableChangeListener =
        std::function<ChangeVerdict(const std::string& key, const std::optional<std::string>& proposed)>;

    virtual ~ConfigurationService() = default;

    virtual std::optional<std::string> getString(const std::string& key) const = 0;

    virtual ListenerId addVetoableChangeListener(const std::string& key, VetoableChangeListener listener) = 0;
    virtual void removeVetoableChangeListener(const std::string& key, ListenerId id) = 0;
};

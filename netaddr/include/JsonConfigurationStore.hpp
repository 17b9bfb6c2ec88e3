#pragma once
#include "ConfigurationService.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

// In-memory configuration backed by a flat JSON object on disk.
// Listeners run under the store lock and must not call back into the store.
class JsonConfigurationStore : public ConfigurationService
{
public:
    JsonConfigurationStore();

    // Replaces the current properties, listeners are not consulted
    bool load(const std::string& path);
    bool save(const std::string& path) const;

    std::optional<std::string> getString(const std::string& key) const override;

    // nullopt removes the property
    ChangeVerdict setProperty(const std::string& key, const std::optional<std::string>& value);

    ListenerId addVetoableChangeListener(const std::string& key, VetoableChangeListener listener) override;
    void removeVetoableChangeListener(const std::string& key, ListenerId id) override;

    std::size_t listenerCount(const std::string& key) const;
    std::map<std::string, std::string> snapshot() const;

private:
    struct ListenerEntry
    {
        ListenerId id;
        VetoableChangeListener listener;
    };

    mutable std::mutex mutex;
    std::map<std::string, std::string> properties;
    std::map<std::string, std::vector<ListenerEntry>> listeners;
    ListenerId nextListenerId;
};

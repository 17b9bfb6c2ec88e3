#include "JsonConfigurationStore.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

JsonConfigurationStore::JsonConfigurationStore()
    : nextListenerId(1)
{
}

bool JsonConfigurationStore::load(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
    {
        SYSTEM_LOG_ERROR("[Config] Failed to open configuration file {}", path);
        return false;
    }

    std::map<std::string, std::string> loaded;
    try
    {
        json document = json::parse(file);
        if (!document.is_object())
        {
            SYSTEM_LOG_ERROR("[Config] {} does not contain a JSON object", path);
            return false;
        }

        for (const auto& item : document.items())
        {
            const json& value = item.value();
            if (value.is_string())
                loaded[item.key()] = value.get<std::string>();
            else if (value.is_number_unsigned())
                loaded[item.key()] = std::to_string(value.get<unsigned long long>());
            else if (value.is_number_integer())
                loaded[item.key()] = std::to_string(value.get<long long>());
            else if (value.is_null())
                continue;
            else
                SYSTEM_LOG_WARNING("[Config] Ignoring {}, only strings and integers are supported", item.key());
        }
    }
    catch (const json::exception& e)
    {
        SYSTEM_LOG_ERROR("[Config] Failed to parse {}: {}", path, e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex);
    properties = std::move(loaded);
    SYSTEM_LOG_INFO("[Config] Loaded {} properties from {}", properties.size(), path);
    return true;
}

bool JsonConfigurationStore::save(const std::string& path) const
{
    json document = json::object();
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [key, value] : properties)
            document[key] = value;
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file)
    {
        SYSTEM_LOG_ERROR("[Config] Failed to open {} for writing", path);
        return false;
    }

    file << document.dump(4) << '\n';
    if (!file)
    {
        SYSTEM_LOG_ERROR("[Config] Failed to write {}", path);
        return false;
    }
    return true;
}

std::optional<std::string> JsonConfigurationStore::getString(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = properties.find(key);
    if (it == properties.end())
        return std::nullopt;
    return it->second;
}

ChangeVerdict JsonConfigurationStore::setProperty(const std::string& key, const std::optional<std::string>& value)
{
    std::lock_guard<std::mutex> lock(mutex);

    auto registered = listeners.find(key);
    if (registered != listeners.end())
    {
        for (const auto& entry : registered->second)
        {
            ChangeVerdict verdict = entry.listener(key, value);
            if (!verdict)
            {
                SYSTEM_LOG_WARNING("[Config] Change of {} vetoed: {}", key, verdict.reason);
                return verdict;
            }
        }
    }

    if (value)
        properties[key] = *value;
    else
        properties.erase(key);

    SYSTEM_LOG_DEBUG("[Config] {} set to '{}'", key, value.value_or("<unset>"));
    return ChangeVerdict::accept();
}

ConfigurationService::ListenerId JsonConfigurationStore::addVetoableChangeListener(
    const std::string& key, VetoableChangeListener listener)
{
    std::lock_guard<std::mutex> lock(mutex);
    ListenerId id = nextListenerId++;
    listeners[key].push_back(ListenerEntry{id, std::move(listener)});
    return id;
}

void JsonConfigurationStore::removeVetoableChangeListener(const std::string& key, ListenerId id)
{
    std::lock_guard<std::mutex> lock(mutex);
    auto registered = listeners.find(key);
    if (registered == listeners.end())
        return;

    auto& entries = registered->second;
    entries.erase(
        std::remove_if(entries.begin(), entries.end(),
            [id](const ListenerEntry& entry) { return entry.id == id; }),
        entries.end());

    if (entries.empty())
        listeners.erase(registered);
}

std::size_t JsonConfigurationStore::listenerCount(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto registered = listeners.find(key);
    return registered == listeners.end() ? 0 : registered->second.size();
}

std::map<std::string, std::string> JsonConfigurationStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return properties;
}

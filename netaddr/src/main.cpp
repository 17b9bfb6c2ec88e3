#include "JsonConfigurationStore.hpp"
#include "Logger.hpp"
#include "NetworkAddressManager.hpp"
#include "Utils.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <boost/stacktrace.hpp>

namespace
{
const char* DEFAULT_CONFIG_FILE = "netaddr.json";

std::atomic<bool> g_running = true;

void signalHandler(int)
{
    g_running = false;
}

std::string stackTraceToString()
{
    std::ostringstream oss;
    oss << boost::stacktrace::stacktrace();
    return oss.str();
}

void onTerminate()
{
    if (auto eptr = std::current_exception())
    {
        try { std::rethrow_exception(eptr); }
        catch (std::exception const& ex)
        {
            SYSTEM_LOG_ERROR("Unhandled exception: {}", ex.what());
        }
        catch (...)
        {
            SYSTEM_LOG_ERROR("Unhandled non-std exception");
        }
    }
    else
    {
        SYSTEM_LOG_ERROR("Terminate called without an exception");
    }
    SYSTEM_LOG_ERROR("Stack trace:\n{}", stackTraceToString());
    std::_Exit(EXIT_FAILURE);
}

// Called on fatal signals
void onSignal(int sig)
{
    SYSTEM_LOG_ERROR("Received signal: {}", sig);
    SYSTEM_LOG_ERROR("Stack trace:\n{}", stackTraceToString());
    std::_Exit(EXIT_FAILURE);
}

std::optional<boost::asio::ip::address> parseAddress(std::string text)
{
    if (text.size() > 2 && text.front() == '[' && text.back() == ']')
        text = text.substr(1, text.size() - 2);

    boost::system::error_code ec;
    auto parsed = boost::asio::ip::make_address(text, ec);
    if (ec)
    {
        SYSTEM_LOG_ERROR("[CLI] {} is not an IP address", text);
        return std::nullopt;
    }
    return parsed;
}

std::optional<uint16_t> parsePort(const std::string& text)
{
    auto port = utils::parseInteger(text);
    if (!port || *port < 0 || *port > 65535)
    {
        SYSTEM_LOG_ERROR("[CLI] {} is not a valid port", text);
        return std::nullopt;
    }
    return static_cast<uint16_t>(*port);
}

void printHelp()
{
    SYSTEM_LOG_INFO("Commands:");
    SYSTEM_LOG_INFO("  /public <port> [destination] - Address to advertise for a local port");
    SYSTEM_LOG_INFO("  /localhost <destination> - Local address used to reach a destination");
    SYSTEM_LOG_INFO("  /set <key> <value> - Change a setting (STUN settings are checked first)");
    SYSTEM_LOG_INFO("  /unset <key> - Remove a setting");
    SYSTEM_LOG_INFO("  /reinit - Restart the address manager with the current settings");
    SYSTEM_LOG_INFO("  /save - Write the settings back to the configuration file");
    SYSTEM_LOG_INFO("  /status - Display STUN and local host discovery state");
    SYSTEM_LOG_INFO("  /logs - Toggle debug logging");
    SYSTEM_LOG_INFO("  /traffic - Toggle logging of every STUN datagram");
    SYSTEM_LOG_INFO("  /quit or /exit - Exit the application");
    SYSTEM_LOG_INFO("  /help - Show this help message");
}

void printStatus(const NetworkAddressManager& manager, const JsonConfigurationStore& store)
{
    SYSTEM_LOG_INFO("[Status] {}", manager.isStarted() ? "Started" : "Stopped");
    if (auto server = manager.stunServer())
        SYSTEM_LOG_INFO("  STUN server: {} ({})", server->toString(), manager.isStunEnabled() ? "enabled" : "unavailable");
    else
        SYSTEM_LOG_INFO("  STUN server: not configured");
    SYSTEM_LOG_INFO("  Local host discovery: {}", manager.hasProbeSocket() ? "ready" : "degraded");
    for (const auto& [key, value] : store.snapshot())
        SYSTEM_LOG_INFO("  {} = {}", key, value);
}

void handleCommand(const std::string& line, NetworkAddressManager& manager, JsonConfigurationStore& store,
                   const std::string& configPath)
{
    std::istringstream input(line);
    std::string command;
    input >> command;

    if (command == "/quit" || command == "/exit")
    {
        g_running = false;
    }
    else if (command == "/help")
    {
        printHelp();
    }
    else if (command == "/public")
    {
        std::string portText, destinationText;
        input >> portText >> destinationText;
        auto port = parsePort(portText);
        if (!port)
            return;

        boost::asio::ip::udp::endpoint advertised;
        if (destinationText.empty())
        {
            advertised = manager.getPublicAddressFor(*port);
        }
        else
        {
            auto destination = parseAddress(destinationText);
            if (!destination)
                return;
            advertised = manager.getPublicAddressFor(*destination, *port);
        }
        SYSTEM_LOG_INFO("[Public] {}", utils::endpointToString(advertised));
    }
    else if (command == "/localhost")
    {
        std::string destinationText;
        input >> destinationText;
        auto destination = parseAddress(destinationText);
        if (!destination)
            return;
        SYSTEM_LOG_INFO("[LocalHost] {}", manager.getLocalHost(*destination).to_string());
    }
    else if (command == "/set")
    {
        std::string key, value;
        input >> key;
        std::getline(input, value);
        value = utils::trim(value);
        if (key.empty())
        {
            SYSTEM_LOG_ERROR("[CLI] Usage: /set <key> <value>");
            return;
        }

        ChangeVerdict verdict = store.setProperty(key, value);
        if (!verdict)
            SYSTEM_LOG_ERROR("[Config] {} rejected: {}", key, verdict.reason);
        else
            SYSTEM_LOG_INFO("[Config] {} = {} (applied on /reinit)", key, value);
    }
    else if (command == "/unset")
    {
        std::string key;
        input >> key;
        ChangeVerdict verdict = store.setProperty(key, std::nullopt);
        if (!verdict)
            SYSTEM_LOG_ERROR("[Config] Removing {} rejected: {}", key, verdict.reason);
        else
            SYSTEM_LOG_INFO("[Config] {} removed", key);
    }
    else if (command == "/reinit")
    {
        manager.start();
    }
    else if (command == "/save")
    {
        if (store.save(configPath))
            SYSTEM_LOG_INFO("[Config] Saved to {}", configPath);
    }
    else if (command == "/status")
    {
        printStatus(manager, store);
    }
    else if (command == "/logs")
    {
        setVerboseLogging(!isVerboseLogging());
        SYSTEM_LOG_INFO("[CLI] Debug logging {}", isVerboseLogging() ? "enabled" : "disabled");
    }
    else if (command == "/traffic")
    {
        setShouldLogTraffic(!shouldLogTraffic());
        SYSTEM_LOG_INFO("[CLI] Traffic logging {}", shouldLogTraffic() ? "enabled" : "disabled");
    }
    else if (!command.empty())
    {
        SYSTEM_LOG_WARNING("[CLI] Unknown command {}, type /help", command);
    }
}
}

int main(int argc, char* argv[])
{
    initLogging();
    std::set_terminate(onTerminate);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGSEGV, onSignal);
    std::signal(SIGABRT, onSignal);
    std::signal(SIGFPE, onSignal);
    std::signal(SIGILL, onSignal);
    std::signal(SIGTERM, onSignal);

    const std::string configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_FILE;

    JsonConfigurationStore store;
    if (std::filesystem::exists(configPath))
    {
        if (!store.load(configPath))
        {
            SYSTEM_LOG_ERROR("Failed to load {}. Exiting.", configPath);
            return 1;
        }
    }
    else
    {
        SYSTEM_LOG_INFO("{} not found, starting with an empty configuration", configPath);
    }

    NetworkAddressManager manager(store);
    manager.start();

    SYSTEM_LOG_INFO("Type /help for available commands.");

    std::string line;
    while (g_running && std::getline(std::cin, line))
    {
        handleCommand(utils::trim(line), manager, store, configPath);
    }

    manager.stop();
    SYSTEM_LOG_INFO("Application exiting. Goodbye!");
    return 0;
}

#pragma once
#include "ConfigurationService.hpp"
#include "LocalAddressSelector.hpp"
#include "NetworkEnvironment.hpp"
#include "ProbeSocket.hpp"
#include "StunClient.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio.hpp>

/**
 * Decides which address and port to advertise to a peer.
 *
 * Asks the configured STUN server for the NAT mapping when STUN is enabled
 * and falls back to the local address the routing table picks for the
 * destination. STUN is optional: a missing, invalid or unreachable server
 * only disables it. Configuration changes to the STUN server are validated
 * on commit and applied by the next start().
 *
 * Public operations are safe to call concurrently.
 */
class NetworkAddressManager
{
public:
    using DetectorFactory = std::function<std::unique_ptr<MappingDetector>(const StunServerConfig&)>;

    // Null members are replaced by the system implementations
    struct Collaborators
    {
        DetectorFactory detectorFactory;
        std::shared_ptr<ProbeSocketFactory> probeSocketFactory;
        std::shared_ptr<NetworkEnvironment> environment;
        ProbeSocketManager::PortPicker portPicker;

        static Collaborators system();
    };

    // Picks the public route when no STUN server is configured, never queried
    static constexpr const char* DEFAULT_STUN_SERVER_ADDRESS = "stun.iptel.org";
    static constexpr uint16_t DEFAULT_STUN_SERVER_PORT = 3478;

    explicit NetworkAddressManager(ConfigurationService& configuration,
                                   Collaborators collaborators = Collaborators::system());
    ~NetworkAddressManager();

    NetworkAddressManager(const NetworkAddressManager&) = delete;
    NetworkAddressManager& operator=(const NetworkAddressManager&) = delete;

    // Reads the configuration again when called on a started manager
    void start();
    void stop();

    boost::asio::ip::address getLocalHost(const boost::asio::ip::address& destination);

    boost::asio::ip::udp::endpoint getPublicAddressFor(const boost::asio::ip::address& destination, uint16_t port);
    // Routes towards the STUN server (or the default one) as destination.
    // The server name is resolved once by start(), never per call.
    boost::asio::ip::udp::endpoint getPublicAddressFor(uint16_t port);

    bool isStarted() const;
    bool isStunEnabled() const;
    // Configured server, kept even when its detector failed to start
    std::optional<StunServerConfig> stunServer() const;
    bool hasProbeSocket() const;

private:
    static Collaborators withDefaults(Collaborators collaborators);

    void stopLocked();
    void initializeStun();
    void registerConfigurationGate();
    void unregisterConfigurationGate();
    int readBindRetries() const;
    std::optional<boost::asio::ip::address> readPreferredAddress() const;
    void initializeLocalHostFinder();
    void initializeRouteDestination();
    boost::asio::ip::address routeDestination() const;

    ConfigurationService& configuration;
    Collaborators collaborators;
    LocalAddressSelector selector;
    StunClient stunClient;

    mutable std::mutex stateMutex;
    bool started;
    std::atomic<bool> useStun;
    std::optional<StunServerConfig> stunConfig;
    std::vector<std::pair<std::string, ConfigurationService::ListenerId>> gateListeners;

    // Separate from stateMutex so callers never wait for start()
    mutable std::mutex routeMutex;
    boost::asio::ip::address routeTarget;
};

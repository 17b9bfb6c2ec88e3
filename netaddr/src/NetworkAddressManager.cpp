#include "NetworkAddressManager.hpp"
#include "Logger.hpp"
#include "StunConfigValidator.hpp"
#include "Utils.hpp"

using boost::asio::ip::address;
using boost::asio::ip::udp;

NetworkAddressManager::Collaborators NetworkAddressManager::Collaborators::system()
{
    Collaborators collaborators;
    collaborators.detectorFactory = [](const StunServerConfig& server) -> std::unique_ptr<MappingDetector> {
        return std::make_unique<StunAddressDetector>(server);
    };
    collaborators.probeSocketFactory = std::make_shared<UdpProbeSocketFactory>();
    collaborators.environment = std::make_shared<SystemNetworkEnvironment>();
    collaborators.portPicker = utils::randomPortNumber;
    return collaborators;
}

NetworkAddressManager::Collaborators NetworkAddressManager::withDefaults(Collaborators collaborators)
{
    Collaborators defaults = Collaborators::system();
    if (!collaborators.detectorFactory)
        collaborators.detectorFactory = std::move(defaults.detectorFactory);
    if (!collaborators.probeSocketFactory)
        collaborators.probeSocketFactory = std::move(defaults.probeSocketFactory);
    if (!collaborators.environment)
        collaborators.environment = std::move(defaults.environment);
    if (!collaborators.portPicker)
        collaborators.portPicker = std::move(defaults.portPicker);
    return collaborators;
}

NetworkAddressManager::NetworkAddressManager(ConfigurationService& configuration, Collaborators collaborators)
    : configuration(configuration)
    , collaborators(withDefaults(std::move(collaborators)))
    , selector(this->collaborators.environment)
    , started(false)
    , useStun(false)
    , routeTarget(boost::asio::ip::address_v4::any())
{
}

NetworkAddressManager::~NetworkAddressManager()
{
    try
    {
        stop();
    }
    catch (const std::exception& e)
    {
        SYSTEM_LOG_ERROR("[NetAddr] Error while stopping: {}", e.what());
    }
}

void NetworkAddressManager::start()
{
    std::lock_guard<std::mutex> lock(stateMutex);
    if (started)
    {
        SYSTEM_LOG_INFO("[NetAddr] Reinitializing");
        stopLocked();
    }

    initializeStun();
    initializeRouteDestination();
    registerConfigurationGate();
    selector.setPreferredAddress(readPreferredAddress());
    initializeLocalHostFinder();

    started = true;
    SYSTEM_LOG_INFO("[NetAddr] Started (STUN {}, local host discovery {})",
                    useStun ? "enabled" : "disabled", selector.hasProbeSocket() ? "ready" : "degraded");
}

void NetworkAddressManager::stop()
{
    std::lock_guard<std::mutex> lock(stateMutex);
    stopLocked();
}

void NetworkAddressManager::stopLocked()
{
    stunClient.shutDown();
    useStun = false;
    stunConfig.reset();
    {
        std::lock_guard<std::mutex> lock(routeMutex);
        routeTarget = boost::asio::ip::address_v4::any();
    }

    unregisterConfigurationGate();

    selector.reset();
    selector.setPreferredAddress(std::nullopt);

    if (started)
        SYSTEM_LOG_INFO("[NetAddr] Stopped");
    started = false;
}

void NetworkAddressManager::initializeStun()
{
    useStun = false;
    stunConfig.reset();

    auto host = configuration.getString(ConfigKeys::STUN_SERVER_ADDRESS);
    auto port = configuration.getString(ConfigKeys::STUN_SERVER_PORT);
    if (!host || !port || utils::isBlank(*host) || utils::isBlank(*port))
    {
        SYSTEM_LOG_INFO("[NetAddr] No STUN server configured, STUN disabled");
        return;
    }

    auto server = StunConfigValidator::parseStunServerConfig(host, port);
    if (!server)
    {
        SYSTEM_LOG_ERROR("[NetAddr] Invalid STUN server setting {}:{}, STUN disabled", *host, *port);
        return;
    }
    stunConfig = server;

    std::unique_ptr<MappingDetector> detector;
    try
    {
        detector = collaborators.detectorFactory(*server);
    }
    catch (const std::exception& e)
    {
        SYSTEM_LOG_ERROR("[NetAddr] Cannot create a STUN detector for {}: {}", server->toString(), e.what());
        return;
    }

    if (!detector)
    {
        SYSTEM_LOG_ERROR("[NetAddr] No STUN detector available for {}", server->toString());
        return;
    }

    SYSTEM_LOG_DEBUG("[NetAddr] Created {}", detector->describe());
    if (!stunClient.start(std::move(detector)))
    {
        SYSTEM_LOG_WARNING("[NetAddr] Continuing without STUN");
        return;
    }

    useStun = true;
}

void NetworkAddressManager::registerConfigurationGate()
{
    auto gate = [](const std::string& key, const std::optional<std::string>& proposed) {
        ChangeVerdict verdict = StunConfigValidator::validate(key, proposed);
        if (!verdict)
            SYSTEM_LOG_WARNING("[NetAddr] Rejected {}: {}", key, verdict.reason);
        return verdict;
    };

    for (const char* key : {ConfigKeys::STUN_SERVER_ADDRESS, ConfigKeys::STUN_SERVER_PORT})
    {
        ConfigurationService::ListenerId id = configuration.addVetoableChangeListener(key, gate);
        gateListeners.emplace_back(key, id);
    }
}

void NetworkAddressManager::unregisterConfigurationGate()
{
    for (const auto& [key, id] : gateListeners)
        configuration.removeVetoableChangeListener(key, id);
    gateListeners.clear();
}

int NetworkAddressManager::readBindRetries() const
{
    auto value = configuration.getString(ConfigKeys::BIND_RETRIES);
    if (!value || utils::isBlank(*value))
        return ProbeSocketManager::DEFAULT_BIND_RETRIES;

    auto retries = utils::parseInteger(utils::trim(*value));
    if (!retries)
    {
        SYSTEM_LOG_ERROR("[NetAddr] {} is not a valid value for {}, using {}", *value, ConfigKeys::BIND_RETRIES,
                         ProbeSocketManager::DEFAULT_BIND_RETRIES);
        return ProbeSocketManager::DEFAULT_BIND_RETRIES;
    }
    return static_cast<int>(*retries);
}

std::optional<address> NetworkAddressManager::readPreferredAddress() const
{
    auto value = configuration.getString(ConfigKeys::PREFERRED_NETWORK_ADDRESS);
    if (!value || utils::isBlank(*value))
        return std::nullopt;

    std::string literal = utils::trim(*value);
    if (literal.size() > 2 && literal.front() == '[' && literal.back() == ']')
        literal = literal.substr(1, literal.size() - 2);

    boost::system::error_code ec;
    address preferred = boost::asio::ip::make_address(literal, ec);
    if (ec)
    {
        SYSTEM_LOG_WARNING("[NetAddr] Ignoring {}={}: {}", ConfigKeys::PREFERRED_NETWORK_ADDRESS, *value,
                           ec.message());
        return std::nullopt;
    }

    SYSTEM_LOG_INFO("[NetAddr] Preferring {} when it is assigned locally", preferred.to_string());
    return preferred;
}

void NetworkAddressManager::initializeLocalHostFinder()
{
    ProbeSocketManager manager(collaborators.probeSocketFactory, collaborators.portPicker);
    selector.reset(manager.initialize(readBindRetries()));
}

void NetworkAddressManager::initializeRouteDestination()
{
    const StunServerConfig target =
        stunConfig.value_or(StunServerConfig{DEFAULT_STUN_SERVER_ADDRESS, DEFAULT_STUN_SERVER_PORT});

    address destination = boost::asio::ip::address_v4::any();
    boost::system::error_code ec;
    address literal = boost::asio::ip::make_address(target.host, ec);
    if (auto resolved = stunClient.serverEndpoint())
    {
        destination = resolved->address();
    }
    else if (!ec)
    {
        destination = literal;
    }
    else
    {
        try
        {
            destination = collaborators.environment->resolve(target.host);
        }
        catch (const std::exception& e)
        {
            NETWORK_LOG_WARNING("[NetAddr] Cannot resolve {} ({}), routing through the default interface",
                                target.toString(), e.what());
        }
    }

    NETWORK_LOG_DEBUG("[NetAddr] Implicit destination is {} ({})", destination.to_string(), target.toString());
    std::lock_guard<std::mutex> lock(routeMutex);
    routeTarget = destination;
}

address NetworkAddressManager::routeDestination() const
{
    std::lock_guard<std::mutex> lock(routeMutex);
    return routeTarget;
}

address NetworkAddressManager::getLocalHost(const address& destination)
{
    return selector.getLocalHost(destination);
}

udp::endpoint NetworkAddressManager::getPublicAddressFor(const address& destination, uint16_t port)
{
    if (useStun)
    {
        if (auto mapped = stunClient.queryMapping(port))
            return *mapped;

        NETWORK_LOG_INFO("[NetAddr] STUN gave no mapping for port {}, using the local address", port);
    }

    return udp::endpoint(getLocalHost(destination), port);
}

udp::endpoint NetworkAddressManager::getPublicAddressFor(uint16_t port)
{
    return getPublicAddressFor(routeDestination(), port);
}

bool NetworkAddressManager::isStarted() const
{
    std::lock_guard<std::mutex> lock(stateMutex);
    return started;
}

bool NetworkAddressManager::isStunEnabled() const
{
    return useStun;
}

std::optional<StunServerConfig> NetworkAddressManager::stunServer() const
{
    std::lock_guard<std::mutex> lock(stateMutex);
    return stunConfig;
}

bool NetworkAddressManager::hasProbeSocket() const
{
    return selector.hasProbeSocket();
}

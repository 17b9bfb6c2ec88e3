#include "LocalAddressSelector.hpp"
#include "Logger.hpp"

using boost::asio::ip::address;
using boost::asio::ip::address_v4;
using boost::asio::ip::address_v6;
using boost::asio::ip::udp;

namespace
{
address wildcardFor(const address& destination)
{
    if (destination.is_v6())
        return address_v6::any();
    return address_v4::any();
}

bool isGloballyRoutableV6(const address_v6& candidate)
{
    return !candidate.is_unspecified()
        && !candidate.is_link_local()
        && !candidate.is_site_local()
        && !candidate.is_loopback();
}
}

LocalAddressSelector::LocalAddressSelector(std::shared_ptr<NetworkEnvironment> environment)
    : environment(std::move(environment))
{
}

address LocalAddressSelector::getLocalHost(const address& destination)
{
    if (auto preferred = preferredFor(destination))
        return *preferred;

    address localHost = wildcardFor(destination);
    if (!destination.is_unspecified())
    {
        if (auto probed = probe(destination))
            localHost = *probed;
    }

    if (!localHost.is_unspecified())
        return localHost;

    // Some stacks report the any address for connected UDP sockets
    localHost = wildcardFor(destination);
    try
    {
        if (destination.is_v6())
        {
            if (auto global = findGlobalIpv6Address())
                return *global;

            NETWORK_LOG_WARNING("[LocalHost] No globally routable IPv6 address found for {}, returning {}",
                                destination.to_string(), localHost.to_string());
        }
        else
        {
            localHost = environment->localHostAddress();
        }
    }
    catch (const std::exception& e)
    {
        SYSTEM_LOG_WARNING("[LocalHost] Failed to get localhost for {}: {}", destination.to_string(), e.what());
    }

    return localHost;
}

std::optional<address> LocalAddressSelector::probe(const address& destination)
{
    std::lock_guard<std::mutex> lock(probeMutex);
    if (!probeSocket)
    {
        NETWORK_LOG_DEBUG("[LocalHost] No discovery socket, skipping the routing table query for {}",
                          destination.to_string());
        return std::nullopt;
    }

    std::optional<address> local;
    try
    {
        probeSocket->connect(udp::endpoint(destination, RANDOM_ADDR_DISC_PORT));
        local = probeSocket->localAddress();
        NETWORK_LOG_DEBUG("[LocalHost] Kernel picked {} for {}", local->to_string(), destination.to_string());
    }
    catch (const std::exception& e)
    {
        NETWORK_LOG_WARNING("[LocalHost] Routing table query for {} failed: {}", destination.to_string(), e.what());
    }

    // Leave the socket unconnected for the next caller, the answer stands either way
    try
    {
        probeSocket->disconnect();
    }
    catch (const std::exception& e)
    {
        NETWORK_LOG_DEBUG("[LocalHost] Discovery socket disconnect failed: {}", e.what());
    }
    return local;
}

std::optional<address> LocalAddressSelector::preferredFor(const address& destination) const
{
    std::optional<address> preferred;
    {
        std::lock_guard<std::mutex> lock(preferredMutex);
        preferred = preferredAddress;
    }

    if (!preferred || preferred->is_v6() != destination.is_v6())
        return std::nullopt;

    try
    {
        for (const auto& iface : environment->interfaces())
        {
            for (const auto& candidate : iface.addresses)
            {
                if (candidate == *preferred)
                    return preferred;

                // Interface addresses carry a scope id, the configured literal may not
                if (candidate.is_v6() && preferred->is_v6()
                    && candidate.to_v6().to_bytes() == preferred->to_v6().to_bytes())
                    return preferred;
            }
        }
    }
    catch (const std::exception& e)
    {
        SYSTEM_LOG_WARNING("[LocalHost] Cannot check preferred address {}: {}", preferred->to_string(), e.what());
        return std::nullopt;
    }

    NETWORK_LOG_DEBUG("[LocalHost] Preferred address {} is not assigned to any interface, ignoring it",
                      preferred->to_string());
    return std::nullopt;
}

std::optional<address> LocalAddressSelector::findGlobalIpv6Address() const
{
    for (const auto& iface : environment->interfaces())
    {
        for (const auto& candidate : iface.addresses)
        {
            if (candidate.is_v6() && isGloballyRoutableV6(candidate.to_v6()))
            {
                NETWORK_LOG_DEBUG("[LocalHost] Using {} from interface {}", candidate.to_string(), iface.name);
                return candidate;
            }
        }
    }
    return std::nullopt;
}

void LocalAddressSelector::reset(std::unique_ptr<ProbeSocket> socket)
{
    std::lock_guard<std::mutex> lock(probeMutex);
    probeSocket = std::move(socket);
}

bool LocalAddressSelector::hasProbeSocket() const
{
    std::lock_guard<std::mutex> lock(probeMutex);
    return probeSocket != nullptr;
}

void LocalAddressSelector::setPreferredAddress(std::optional<address> preferred)
{
    std::lock_guard<std::mutex> lock(preferredMutex);
    preferredAddress = std::move(preferred);
}

#pragma once
#include "NetworkEnvironment.hpp"
#include "ProbeSocket.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <boost/asio.hpp>

class LocalAddressSelector
{
public:
    // Unlikely to be in use, nothing is ever sent to it
    static constexpr uint16_t RANDOM_ADDR_DISC_PORT = 55721;

    explicit LocalAddressSelector(std::shared_ptr<NetworkEnvironment> environment);

    /**
     * Returns the local address to advertise when talking to destination.
     *
     * Asks the kernel through the probe socket first. When that yields the
     * wildcard address (or there is no probe socket) it falls back to the
     * first globally routable interface address for IPv6 destinations and
     * to the host's own address for IPv4 ones. Never throws, the result may
     * still be the wildcard when every path fails.
     */
    boost::asio::ip::address getLocalHost(const boost::asio::ip::address& destination);

    // Installs a new probe socket, nullptr leaves the selector degraded
    void reset(std::unique_ptr<ProbeSocket> socket = nullptr);
    bool hasProbeSocket() const;

    // Returned by getLocalHost while it is assigned to a local interface
    void setPreferredAddress(std::optional<boost::asio::ip::address> preferred);

private:
    std::optional<boost::asio::ip::address> probe(const boost::asio::ip::address& destination);
    std::optional<boost::asio::ip::address> preferredFor(const boost::asio::ip::address& destination) const;
    std::optional<boost::asio::ip::address> findGlobalIpv6Address() const;

    std::shared_ptr<NetworkEnvironment> environment;

    // Guards the connect -> read -> disconnect sequence
    mutable std::mutex probeMutex;
    std::unique_ptr<ProbeSocket> probeSocket;

    mutable std::mutex preferredMutex;
    std::optional<boost::asio::ip::address> preferredAddress;
};

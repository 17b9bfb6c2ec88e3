#pragma once
#include <string>
#include <vector>
#include <boost/asio.hpp>

struct NetworkInterfaceInfo
{
    std::string name;
    std::vector<boost::asio::ip::address> addresses;
};

// What the OS knows about local interfaces and the host's own address
class NetworkEnvironment
{
public:
    virtual ~NetworkEnvironment() = default;

    // Interfaces in OS order, with every address bound to each
    virtual std::vector<NetworkInterfaceInfo> interfaces() const = 0;

    // The address the host name resolves to, IPv4 first.
    // Throws std::runtime_error when it cannot be determined.
    virtual boost::asio::ip::address localHostAddress() const = 0;

    // First address a host name resolves to, throws std::runtime_error
    virtual boost::asio::ip::address resolve(const std::string& host) const = 0;
};

class SystemNetworkEnvironment : public NetworkEnvironment
{
public:
    std::vector<NetworkInterfaceInfo> interfaces() const override;
    boost::asio::ip::address localHostAddress() const override;
    boost::asio::ip::address resolve(const std::string& host) const override;
};

#include "NetworkEnvironment.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <ifaddrs.h>
#include <netinet/in.h>

namespace
{
std::vector<NetworkInterfaceInfo>::iterator findOrAdd(std::vector<NetworkInterfaceInfo>& result, const char* name)
{
    auto it = std::find_if(result.begin(), result.end(),
        [name](const NetworkInterfaceInfo& info) { return info.name == name; });
    if (it != result.end())
        return it;

    result.push_back(NetworkInterfaceInfo{name, {}});
    return result.end() - 1;
}
}

std::vector<NetworkInterfaceInfo> SystemNetworkEnvironment::interfaces() const
{
    ifaddrs* ifAddrStruct = nullptr;
    if (::getifaddrs(&ifAddrStruct) != 0)
    {
        throw std::runtime_error(std::string("getifaddrs failed: ") + std::strerror(errno));
    }

    std::vector<NetworkInterfaceInfo> result;
    for (ifaddrs* ifa = ifAddrStruct; ifa != nullptr; ifa = ifa->ifa_next)
    {
        if (!ifa->ifa_addr)
            continue;

        if (ifa->ifa_addr->sa_family == AF_INET)
        {
            const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
            boost::asio::ip::address_v4::bytes_type bytes;
            std::memcpy(bytes.data(), &sin->sin_addr, bytes.size());
            findOrAdd(result, ifa->ifa_name)->addresses.push_back(boost::asio::ip::address_v4(bytes));
        }
        else if (ifa->ifa_addr->sa_family == AF_INET6)
        {
            const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_addr);
            boost::asio::ip::address_v6::bytes_type bytes;
            std::memcpy(bytes.data(), &sin6->sin6_addr, bytes.size());
            findOrAdd(result, ifa->ifa_name)->addresses.push_back(
                boost::asio::ip::address_v6(bytes, sin6->sin6_scope_id));
        }
    }

    ::freeifaddrs(ifAddrStruct);
    return result;
}

boost::asio::ip::address SystemNetworkEnvironment::localHostAddress() const
{
    boost::asio::io_context ioContext;
    boost::asio::ip::udp::resolver resolver(ioContext);

    const std::string hostName = boost::asio::ip::host_name();
    boost::system::error_code ec;
    auto results = resolver.resolve(hostName, "", ec);
    if (ec || results.empty())
    {
        throw std::runtime_error("cannot resolve local host name " + hostName + ": " + ec.message());
    }

    for (const auto& entry : results)
    {
        if (entry.endpoint().address().is_v4())
            return entry.endpoint().address();
    }

    NETWORK_LOG_DEBUG("[Environment] {} has no IPv4 address, using {}", hostName,
                      results.begin()->endpoint().address().to_string());
    return results.begin()->endpoint().address();
}

boost::asio::ip::address SystemNetworkEnvironment::resolve(const std::string& host) const
{
    boost::asio::io_context ioContext;
    boost::asio::ip::udp::resolver resolver(ioContext);

    boost::system::error_code ec;
    auto results = resolver.resolve(host, "", ec);
    if (ec || results.empty())
    {
        throw std::runtime_error("cannot resolve " + host + ": " + ec.message());
    }
    return results.begin()->endpoint().address();
}

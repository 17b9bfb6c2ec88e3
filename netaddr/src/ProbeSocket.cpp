#include "ProbeSocket.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cerrno>
#include <sys/socket.h>

using boost::asio::ip::udp;

UdpProbeSocket::UdpProbeSocket(uint16_t port)
    : ioContext()
    , socket(ioContext)
    , dualStack(true)
{
    boost::system::error_code ec;
    socket.open(udp::v6(), ec);
    if (!ec)
        socket.set_option(boost::asio::ip::v6_only(false), ec);

    if (ec)
    {
        NETWORK_LOG_DEBUG("[ProbeSocket] No dual-stack socket available ({}), using IPv4 only", ec.message());
        if (socket.is_open())
            socket.close();
        dualStack = false;
        socket.open(udp::v4());
        socket.bind(udp::endpoint(udp::v4(), port));
        return;
    }

    socket.bind(udp::endpoint(udp::v6(), port));
}

void UdpProbeSocket::connect(const udp::endpoint& destination)
{
    udp::endpoint target = destination;
    if (dualStack && destination.address().is_v4())
    {
        target = udp::endpoint(
            boost::asio::ip::make_address_v6(boost::asio::ip::v4_mapped, destination.address().to_v4()),
            destination.port());
    }
    socket.connect(target);
}

boost::asio::ip::address UdpProbeSocket::localAddress() const
{
    boost::asio::ip::address address = socket.local_endpoint().address();
    if (address.is_v6() && address.to_v6().is_v4_mapped())
        return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6());
    return address;
}

void UdpProbeSocket::disconnect()
{
    // connect() to an AF_UNSPEC address dissolves the UDP association
    sockaddr_storage unspecified{};
    unspecified.ss_family = AF_UNSPEC;
    if (::connect(socket.native_handle(), reinterpret_cast<sockaddr*>(&unspecified), sizeof(unspecified)) != 0)
    {
        throw boost::system::system_error(
            boost::system::error_code(errno, boost::system::system_category()),
            "probe socket disconnect");
    }
}

uint16_t UdpProbeSocket::localPort() const
{
    return socket.local_endpoint().port();
}

bool UdpProbeSocket::isDualStack() const
{
    return dualStack;
}

std::unique_ptr<ProbeSocket> UdpProbeSocketFactory::bind(uint16_t port)
{
    auto socket = std::make_unique<UdpProbeSocket>(port);
    NETWORK_LOG_DEBUG("[ProbeSocket] Bound port {} ({})", socket->localPort(),
                      socket->isDualStack() ? "IPv4 and IPv6" : "IPv4 only");
    return socket;
}

ProbeSocketManager::ProbeSocketManager(std::shared_ptr<ProbeSocketFactory> factory, PortPicker portPicker)
    : factory(std::move(factory))
    , portPicker(portPicker ? std::move(portPicker) : PortPicker(utils::randomPortNumber))
{
}

std::unique_ptr<ProbeSocket> ProbeSocketManager::initialize(int maxRetries)
{
    if (maxRetries <= 0)
    {
        SYSTEM_LOG_ERROR("[ProbeSocket] Bind retries set to {}, local host discovery socket not created", maxRetries);
        return nullptr;
    }

    try
    {
        for (int attempt = 1; attempt <= maxRetries; ++attempt)
        {
            uint16_t candidatePort = portPicker();
            try
            {
                std::unique_ptr<ProbeSocket> probe = factory->bind(candidatePort);
                NETWORK_LOG_INFO("[ProbeSocket] Local host discovery socket bound on port {}", probe->localPort());
                return probe;
            }
            catch (const boost::system::system_error& e)
            {
                if (e.code() != boost::asio::error::address_in_use)
                {
                    SYSTEM_LOG_CRITICAL(
                        "[ProbeSocket] Failed to create the local host discovery socket on port {}: {}. "
                        "Local host discovery is unavailable", candidatePort, e.what());
                    return nullptr;
                }
                NETWORK_LOG_DEBUG("[ProbeSocket] Port {} seems in use (attempt {}/{})", candidatePort, attempt, maxRetries);
            }
        }
    }
    catch (const std::exception& e)
    {
        SYSTEM_LOG_CRITICAL("[ProbeSocket] Unexpected error creating the local host discovery socket: {}", e.what());
        return nullptr;
    }

    SYSTEM_LOG_ERROR("[ProbeSocket] Every candidate port was in use after {} attempts, local host discovery degraded", maxRetries);
    return nullptr;
}

#include "StunClient.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>

using boost::asio::ip::udp;

std::string StunServerConfig::toString() const
{
    if (host.find(':') != std::string::npos)
        return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

StunAddressDetector::StunAddressDetector(StunServerConfig server, StunTiming timing)
    : server(std::move(server))
    , timing(timing)
    , running(false)
{
}

void StunAddressDetector::start()
{
    boost::asio::io_context ioContext;
    udp::resolver resolver(ioContext);

    boost::system::error_code ec;
    auto results = resolver.resolve(server.host, std::to_string(server.port), ec);
    if (ec || results.empty())
    {
        throw StunException("Cannot resolve STUN server " + server.toString() + ": " + ec.message());
    }

    udp::endpoint endpoint = results.begin()->endpoint();
    {
        std::lock_guard<std::mutex> lock(mutex);
        resolvedServer = endpoint;
    }
    running = true;

    SYSTEM_LOG_INFO("[STUN] Using server {} ({})", server.toString(), utils::endpointToString(endpoint));
}

void StunAddressDetector::shutDown()
{
    running = false;
}

udp::endpoint StunAddressDetector::getMappingFor(uint16_t localPort)
{
    const std::optional<udp::endpoint> resolved = serverEndpoint();
    if (!running || !resolved)
        throw StunException("STUN detector for " + server.toString() + " is not running");

    const udp::endpoint target = *resolved;
    const TransactionId transactionId = utils::randomTransactionId();
    const std::vector<uint8_t> request = StunMessage::bindingRequest(transactionId);

    boost::asio::io_context ioContext;
    udp::socket socket(ioContext);
    try
    {
        socket.open(target.protocol());
        socket.set_option(udp::socket::reuse_address(true));
        socket.bind(udp::endpoint(target.protocol(), localPort));

        auto wait = timing.initialWaitInterval;
        for (int transmission = 0; transmission <= timing.maxRetransmissions; ++transmission)
        {
            if (!running)
                throw StunException("STUN detector for " + server.toString() + " was shut down");

            socket.send_to(boost::asio::buffer(request), target);
            NETWORK_TRAFFIC_LOG("[STUN] Binding request #{} to {} from port {}",
                                transmission + 1, utils::endpointToString(target), localPort);

            auto deadline = std::chrono::steady_clock::now() + wait;
            if (auto mapped = awaitResponse(ioContext, socket, target, transactionId, deadline))
            {
                NETWORK_LOG_DEBUG("[STUN] Port {} is mapped to {}", localPort, utils::endpointToString(*mapped));
                return *mapped;
            }

            wait = std::min(wait * 2, timing.maxWaitInterval);
        }
    }
    catch (const boost::system::system_error& e)
    {
        throw StunException("STUN query from port " + std::to_string(localPort) + " failed: " + e.what());
    }

    throw StunException("No response from STUN server " + server.toString() + " after "
                        + std::to_string(timing.maxRetransmissions + 1) + " requests");
}

std::optional<udp::endpoint> StunAddressDetector::awaitResponse(
    boost::asio::io_context& ioContext,
    udp::socket& socket,
    const udp::endpoint& target,
    const TransactionId& transactionId,
    std::chrono::steady_clock::time_point deadline)
{
    std::array<uint8_t, 512> response{};
    udp::endpoint senderEndpoint;

    while (std::chrono::steady_clock::now() < deadline)
    {
        bool received = false;
        std::size_t len = 0;
        boost::system::error_code receiveError;

        boost::asio::steady_timer timer(ioContext);
        timer.expires_at(deadline);

        socket.async_receive_from(
            boost::asio::buffer(response), senderEndpoint,
            [&](const boost::system::error_code& error, std::size_t bytesReceived) {
                receiveError = error;
                if (!error)
                {
                    len = bytesReceived;
                    received = true;
                }
                timer.cancel();
            });

        timer.async_wait([&](const boost::system::error_code& error) {
            if (!error)
                socket.cancel();
        });

        // Run IO until one of them finishes
        ioContext.restart();
        ioContext.run();

        if (!received)
        {
            if (receiveError && receiveError != boost::asio::error::operation_aborted)
                throw StunException("STUN receive failed: " + receiveError.message());
            return std::nullopt;
        }

        if (senderEndpoint != target)
        {
            NETWORK_TRAFFIC_LOG("[STUN] Ignoring {} bytes from {}", len, utils::endpointToString(senderEndpoint));
            continue;
        }

        if (!StunMessage::isResponseTo(response.data(), len, transactionId))
        {
            NETWORK_TRAFFIC_LOG("[STUN] Ignoring unrelated datagram ({} bytes)", len);
            continue;
        }

        return StunMessage::parseBindingResponse(response.data(), len, transactionId);
    }

    return std::nullopt;
}

std::string StunAddressDetector::describe() const
{
    return "STUN server " + server.toString();
}

std::optional<udp::endpoint> StunAddressDetector::serverEndpoint() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return resolvedServer;
}

StunClient::~StunClient()
{
    shutDown();
}

bool StunClient::start(std::unique_ptr<MappingDetector> newDetector)
{
    if (!newDetector)
        return false;

    shutDown();

    try
    {
        newDetector->start();
    }
    catch (const StunException& e)
    {
        SYSTEM_LOG_ERROR("[STUN] Failed to start {}: {}", newDetector->describe(), e.what());
        return false;
    }
    catch (const std::exception& e)
    {
        SYSTEM_LOG_ERROR("[STUN] Unexpected error starting {}: {}", newDetector->describe(), e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex);
    detector = std::move(newDetector);
    return true;
}

std::optional<udp::endpoint> StunClient::queryMapping(uint16_t localPort)
{
    std::shared_ptr<MappingDetector> active;
    {
        std::lock_guard<std::mutex> lock(mutex);
        active = detector;
    }

    if (!active)
        return std::nullopt;

    try
    {
        return active->getMappingFor(localPort);
    }
    catch (const StunException& e)
    {
        NETWORK_LOG_WARNING("[STUN] No mapping for port {} from {}: {}", localPort, active->describe(), e.what());
    }
    catch (const std::exception& e)
    {
        NETWORK_LOG_ERROR("[STUN] Query for port {} failed: {}", localPort, e.what());
    }
    return std::nullopt;
}

std::optional<udp::endpoint> StunClient::serverEndpoint() const
{
    std::shared_ptr<MappingDetector> active;
    {
        std::lock_guard<std::mutex> lock(mutex);
        active = detector;
    }

    if (!active)
        return std::nullopt;
    return active->serverEndpoint();
}

void StunClient::shutDown()
{
    std::shared_ptr<MappingDetector> stopping;
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping.swap(detector);
    }

    if (!stopping)
        return;

    try
    {
        stopping->shutDown();
        SYSTEM_LOG_INFO("[STUN] Stopped {}", stopping->describe());
    }
    catch (const std::exception& e)
    {
        // Nothing left to release, the detector is dropped either way
        SYSTEM_LOG_WARNING("[STUN] Failed to shut down {}: {}", stopping->describe(), e.what());
    }
}

bool StunClient::isActive() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return detector != nullptr;
}

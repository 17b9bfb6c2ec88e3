#pragma once
#include "StunMessage.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <boost/asio.hpp>

struct StunServerConfig
{
    std::string host;
    uint16_t port;

    std::string toString() const;
};

// Source of public address mappings for local ports
class MappingDetector
{
public:
    virtual ~MappingDetector() = default;

    // Throws StunException when the detector cannot be used
    virtual void start() = 0;
    virtual void shutDown() = 0;

    // Public endpoint the NAT assigned to localPort, throws StunException
    virtual boost::asio::ip::udp::endpoint getMappingFor(uint16_t localPort) = 0;

    virtual std::string describe() const = 0;

    // Server address found by start(), if the detector has one
    virtual std::optional<boost::asio::ip::udp::endpoint> serverEndpoint() const
    {
        return std::nullopt;
    }
};

// stun4j retransmission defaults
struct StunTiming
{
    std::chrono::milliseconds initialWaitInterval{100};
    std::chrono::milliseconds maxWaitInterval{1600};
    int maxRetransmissions = 6;
};

class StunAddressDetector : public MappingDetector
{
public:
    explicit StunAddressDetector(StunServerConfig server, StunTiming timing = StunTiming());

    void start() override;
    void shutDown() override;

    /**
     * Sends binding requests from localPort (0 picks any port) and waits
     * for the matching response, retransmitting with a doubling interval.
     * Every call owns its socket, so concurrent calls do not interfere.
     */
    boost::asio::ip::udp::endpoint getMappingFor(uint16_t localPort) override;

    std::string describe() const override;
    std::optional<boost::asio::ip::udp::endpoint> serverEndpoint() const override;

private:
    std::optional<boost::asio::ip::udp::endpoint> awaitResponse(
        boost::asio::io_context& ioContext,
        boost::asio::ip::udp::socket& socket,
        const boost::asio::ip::udp::endpoint& server,
        const TransactionId& transactionId,
        std::chrono::steady_clock::time_point deadline);

    StunServerConfig server;
    StunTiming timing;

    mutable std::mutex mutex;
    std::optional<boost::asio::ip::udp::endpoint> resolvedServer;
    std::atomic<bool> running;
};

// Never throws, STUN failures are logged and reported as "no mapping"
class StunClient
{
public:
    StunClient() = default;
    ~StunClient();

    StunClient(const StunClient&) = delete;
    StunClient& operator=(const StunClient&) = delete;

    // Takes ownership of the detector only when it starts
    bool start(std::unique_ptr<MappingDetector> detector);

    std::optional<boost::asio::ip::udp::endpoint> queryMapping(uint16_t localPort);
    std::optional<boost::asio::ip::udp::endpoint> serverEndpoint() const;

    void shutDown();
    bool isActive() const;

private:
    mutable std::mutex mutex;
    std::shared_ptr<MappingDetector> detector;
};

#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <boost/asio.hpp>

// UDP socket used only to ask the kernel which local address it would pick
// for a destination. Never carries traffic.
class ProbeSocket
{
public:
    virtual ~ProbeSocket() = default;

    // UDP connect, associates without any handshake
    virtual void connect(const boost::asio::ip::udp::endpoint& destination) = 0;
    virtual boost::asio::ip::address localAddress() const = 0;
    // Back to the unconnected state
    virtual void disconnect() = 0;
    virtual uint16_t localPort() const = 0;
};

class ProbeSocketFactory
{
public:
    virtual ~ProbeSocketFactory() = default;

    // Throws boost::system::system_error when the port cannot be bound
    virtual std::unique_ptr<ProbeSocket> bind(uint16_t port) = 0;
};

// Dual-stack when the host supports IPv6, IPv4 only otherwise
class UdpProbeSocket : public ProbeSocket
{
public:
    explicit UdpProbeSocket(uint16_t port);

    void connect(const boost::asio::ip::udp::endpoint& destination) override;
    boost::asio::ip::address localAddress() const override;
    void disconnect() override;
    uint16_t localPort() const override;

    bool isDualStack() const;

private:
    boost::asio::io_context ioContext;
    boost::asio::ip::udp::socket socket;
    bool dualStack;
};

class UdpProbeSocketFactory : public ProbeSocketFactory
{
public:
    std::unique_ptr<ProbeSocket> bind(uint16_t port) override;
};

class ProbeSocketManager
{
public:
    using PortPicker = std::function<uint16_t()>;

    static constexpr int DEFAULT_BIND_RETRIES = 5;

    explicit ProbeSocketManager(std::shared_ptr<ProbeSocketFactory> factory, PortPicker portPicker = PortPicker());

    // Binds on random ports, retrying only while the port is in use.
    // Returns nullptr when no socket could be bound, never throws.
    std::unique_ptr<ProbeSocket> initialize(int maxRetries = DEFAULT_BIND_RETRIES);

private:
    std::shared_ptr<ProbeSocketFactory> factory;
    PortPicker portPicker;
};

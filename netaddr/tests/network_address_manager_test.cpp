#include "JsonConfigurationStore.hpp"
#include "NetworkAddressManager.hpp"
#include "TestDoubles.hpp"
#include <chrono>
#include <future>
#include <thread>
#include <gtest/gtest.h>

using boost::asio::ip::make_address;
using boost::asio::ip::udp;

namespace
{
udp::endpoint endpoint(const std::string& ip, uint16_t port)
{
    return udp::endpoint(make_address(ip), port);
}
}

class NetworkAddressManagerTest : public ::testing::Test
{
protected:
    NetworkAddressManagerTest()
        : script(std::make_shared<MappingScript>())
        , sockets(std::make_shared<FakeProbeSocketFactory>(make_address("10.0.0.5")))
        , environment(std::make_shared<FakeNetworkEnvironment>())
        , created(std::make_shared<std::vector<StunServerConfig>>())
    {
        environment->hostAddress = make_address("192.168.1.10");
        environment->interfaceList = {{"eth0", {make_address("192.168.1.10"), make_address("10.0.0.5")}}};
        script->mappings[4000] = endpoint("1.2.3.4", 5000);
    }

    NetworkAddressManager::Collaborators collaborators()
    {
        NetworkAddressManager::Collaborators result;
        auto sharedScript = script;
        auto log = created;
        result.detectorFactory = [sharedScript, log](const StunServerConfig& server) -> std::unique_ptr<MappingDetector> {
            log->push_back(server);
            return std::make_unique<FakeMappingDetector>(sharedScript);
        };
        result.probeSocketFactory = sockets;
        result.environment = environment;
        result.portPicker = [] { return static_cast<uint16_t>(40000); };
        return result;
    }

    void configureStun(const std::string& host, const std::string& port)
    {
        ASSERT_TRUE(store.setProperty(ConfigKeys::STUN_SERVER_ADDRESS, host));
        ASSERT_TRUE(store.setProperty(ConfigKeys::STUN_SERVER_PORT, port));
    }

    JsonConfigurationStore store;
    std::shared_ptr<MappingScript> script;
    std::shared_ptr<FakeProbeSocketFactory> sockets;
    std::shared_ptr<FakeNetworkEnvironment> environment;
    std::shared_ptr<std::vector<StunServerConfig>> created;
};

TEST_F(NetworkAddressManagerTest, StunDisabledUsesLocalHost)
{
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_TRUE(manager.isStarted());
    EXPECT_FALSE(manager.isStunEnabled());
    EXPECT_TRUE(created->empty());

    auto destination = make_address("198.51.100.1");
    EXPECT_EQ(manager.getPublicAddressFor(destination, 4000), udp::endpoint(manager.getLocalHost(destination), 4000));
    EXPECT_EQ(manager.getPublicAddressFor(destination, 4000), endpoint("10.0.0.5", 4000));
}

TEST_F(NetworkAddressManagerTest, StunMappingIsReturned)
{
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    ASSERT_TRUE(manager.isStunEnabled());
    ASSERT_EQ(created->size(), 1u);
    EXPECT_EQ(created->front().host, "stun.example.com");
    EXPECT_EQ(created->front().port, 3478);

    EXPECT_EQ(manager.getPublicAddressFor(make_address("198.51.100.1"), 4000), endpoint("1.2.3.4", 5000));
}

TEST_F(NetworkAddressManagerTest, StunFailureFallsBackToLocalHost)
{
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_EQ(manager.getPublicAddressFor(make_address("198.51.100.1"), 4001), endpoint("10.0.0.5", 4001));
    EXPECT_EQ(script->queries.load(), 1);
}

TEST_F(NetworkAddressManagerTest, DetectorStartFailureDisablesStun)
{
    script->failStart = true;
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_TRUE(manager.isStarted());
    EXPECT_FALSE(manager.isStunEnabled());
    EXPECT_TRUE(manager.hasProbeSocket());
    EXPECT_EQ(store.listenerCount(ConfigKeys::STUN_SERVER_ADDRESS), 1u);
    EXPECT_EQ(store.listenerCount(ConfigKeys::STUN_SERVER_PORT), 1u);

    EXPECT_EQ(manager.getPublicAddressFor(make_address("198.51.100.1"), 4000), endpoint("10.0.0.5", 4000));
    EXPECT_EQ(script->queries.load(), 0);
}

TEST_F(NetworkAddressManagerTest, IncompleteStunConfigDisablesStun)
{
    ASSERT_TRUE(store.setProperty(ConfigKeys::STUN_SERVER_ADDRESS, std::string("stun.example.com")));
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_FALSE(manager.isStunEnabled());
    EXPECT_FALSE(manager.stunServer().has_value());
    EXPECT_TRUE(created->empty());
}

TEST_F(NetworkAddressManagerTest, InvalidStoredStunConfigDisablesStun)
{
    // Written before any gate was listening
    configureStun("stun.example.com", "99999");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_FALSE(manager.isStunEnabled());
    EXPECT_TRUE(created->empty());
}

TEST_F(NetworkAddressManagerTest, GateVetoesInvalidChanges)
{
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_FALSE(store.setProperty(ConfigKeys::STUN_SERVER_ADDRESS, std::string("bad host!")));
    EXPECT_EQ(store.getString(ConfigKeys::STUN_SERVER_ADDRESS), std::optional<std::string>("stun.example.com"));

    EXPECT_FALSE(store.setProperty(ConfigKeys::STUN_SERVER_PORT, std::string("not-a-number")));
    EXPECT_EQ(store.getString(ConfigKeys::STUN_SERVER_PORT), std::optional<std::string>("3478"));

    EXPECT_TRUE(store.setProperty(ConfigKeys::STUN_SERVER_PORT, std::string("")));
    EXPECT_TRUE(store.setProperty(ConfigKeys::BIND_RETRIES, std::string("bad host!")));
}

TEST_F(NetworkAddressManagerTest, AcceptedChangesApplyOnRestart)
{
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    ASSERT_TRUE(store.setProperty(ConfigKeys::STUN_SERVER_ADDRESS, std::string("[2001:db8::1]")));
    ASSERT_TRUE(store.setProperty(ConfigKeys::STUN_SERVER_PORT, std::string("19302")));
    EXPECT_EQ(manager.stunServer()->host, "stun.example.com");

    manager.start();
    ASSERT_TRUE(manager.stunServer().has_value());
    EXPECT_EQ(manager.stunServer()->host, "2001:db8::1");
    EXPECT_EQ(manager.stunServer()->port, 19302);
    EXPECT_EQ(script->shutdowns.load(), 1);

    // Restarting does not stack gates
    EXPECT_EQ(store.listenerCount(ConfigKeys::STUN_SERVER_ADDRESS), 1u);
}

TEST_F(NetworkAddressManagerTest, StopReleasesEverything)
{
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();
    manager.stop();

    EXPECT_FALSE(manager.isStarted());
    EXPECT_FALSE(manager.isStunEnabled());
    EXPECT_FALSE(manager.hasProbeSocket());
    EXPECT_EQ(store.listenerCount(ConfigKeys::STUN_SERVER_ADDRESS), 0u);
    EXPECT_EQ(store.listenerCount(ConfigKeys::STUN_SERVER_PORT), 0u);
    EXPECT_EQ(script->shutdowns.load(), 1);

    EXPECT_TRUE(store.setProperty(ConfigKeys::STUN_SERVER_ADDRESS, std::string("bad host!")));

    // Still answers, without STUN and without the probe socket
    EXPECT_EQ(manager.getPublicAddressFor(make_address("198.51.100.1"), 4000), endpoint("192.168.1.10", 4000));
}

TEST_F(NetworkAddressManagerTest, StopBeforeStartAndTwice)
{
    NetworkAddressManager manager(store, collaborators());
    EXPECT_NO_THROW(manager.stop());
    manager.start();
    EXPECT_NO_THROW(manager.stop());
    EXPECT_NO_THROW(manager.stop());
}

TEST_F(NetworkAddressManagerTest, StopThenStartRestoresService)
{
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();
    manager.stop();
    manager.start();

    EXPECT_TRUE(manager.isStunEnabled());
    EXPECT_TRUE(manager.hasProbeSocket());
    EXPECT_EQ(manager.getPublicAddressFor(make_address("198.51.100.1"), 4000), endpoint("1.2.3.4", 5000));
}

TEST_F(NetworkAddressManagerTest, DetectorShutdownFailureIsIgnored)
{
    script->failShutDown = true;
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_NO_THROW(manager.stop());
    EXPECT_FALSE(manager.isStunEnabled());
}

TEST_F(NetworkAddressManagerTest, DestructorStopsStartedManager)
{
    configureStun("stun.example.com", "3478");
    {
        NetworkAddressManager manager(store, collaborators());
        manager.start();
    }
    EXPECT_EQ(script->shutdowns.load(), 1);
    EXPECT_EQ(store.listenerCount(ConfigKeys::STUN_SERVER_ADDRESS), 0u);
}

TEST_F(NetworkAddressManagerTest, BindRetriesSetting)
{
    sockets->failWith(boost::asio::error::address_in_use, 3);
    ASSERT_TRUE(store.setProperty(ConfigKeys::BIND_RETRIES, std::string("3")));
    NetworkAddressManager manager(store, collaborators());
    manager.start();
    EXPECT_FALSE(manager.hasProbeSocket());
    EXPECT_EQ(sockets->ports().size(), 3u);

    sockets->failWith(boost::asio::error::address_in_use, 3);
    ASSERT_TRUE(store.setProperty(ConfigKeys::BIND_RETRIES, std::string("4")));
    manager.start();
    EXPECT_TRUE(manager.hasProbeSocket());
}

TEST_F(NetworkAddressManagerTest, InvalidBindRetriesUsesDefault)
{
    sockets->failWith(boost::asio::error::address_in_use, 4);
    ASSERT_TRUE(store.setProperty(ConfigKeys::BIND_RETRIES, std::string("many")));
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_TRUE(manager.hasProbeSocket());
    EXPECT_EQ(sockets->ports().size(), 5u);
}

TEST_F(NetworkAddressManagerTest, FatalBindErrorLeavesStunWorking)
{
    sockets->failWith(boost::asio::error::access_denied);
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_FALSE(manager.hasProbeSocket());
    EXPECT_TRUE(manager.isStunEnabled());
    EXPECT_EQ(manager.getPublicAddressFor(make_address("198.51.100.1"), 4000), endpoint("1.2.3.4", 5000));
    EXPECT_EQ(manager.getPublicAddressFor(make_address("198.51.100.1"), 4001), endpoint("192.168.1.10", 4001));
}

TEST_F(NetworkAddressManagerTest, ImplicitDestinationIsStunServer)
{
    script->failStart = true;
    configureStun("127.0.0.1", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_EQ(manager.getPublicAddressFor(4000), endpoint("10.0.0.5", 4000));
    EXPECT_EQ(sockets->record->lastDestination().address(), make_address("127.0.0.1"));
}

TEST_F(NetworkAddressManagerTest, ImplicitDestinationUsesIpv6Literal)
{
    script->failStart = true;
    configureStun("[::1]", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    manager.getPublicAddressFor(4000);
    EXPECT_EQ(sockets->record->lastDestination().address(), make_address("::1"));
}

TEST_F(NetworkAddressManagerTest, ImplicitDestinationIsResolvedOnceAtStart)
{
    std::vector<std::string> names;
    environment->onResolve = [&names](const std::string& host) { names.push_back(host); };

    NetworkAddressManager manager(store, collaborators());
    manager.start();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names.front(), NetworkAddressManager::DEFAULT_STUN_SERVER_ADDRESS);

    // The default server does not resolve here, so every call uses the default interface
    for (int i = 0; i < 3; ++i)
        EXPECT_EQ(manager.getPublicAddressFor(4000), endpoint("192.168.1.10", 4000));
    EXPECT_EQ(environment->lookups.load(), 1);
    EXPECT_EQ(sockets->record->connects.load(), 0);

    manager.start();
    EXPECT_EQ(environment->lookups.load(), 2);
}

TEST_F(NetworkAddressManagerTest, ImplicitDestinationNameIsNotLookedUpPerCall)
{
    script->failStart = true;
    environment->knownHosts["stun.example.com"] = make_address("198.51.100.7");
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_EQ(manager.getPublicAddressFor(4000), endpoint("10.0.0.5", 4000));
    EXPECT_EQ(manager.getPublicAddressFor(4001), endpoint("10.0.0.5", 4001));
    EXPECT_EQ(sockets->record->lastDestination().address(), make_address("198.51.100.7"));
    EXPECT_EQ(environment->lookups.load(), 1);
}

TEST_F(NetworkAddressManagerTest, ImplicitDestinationReusesDetectorServer)
{
    script->server = endpoint("203.0.113.7", 3478);
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    EXPECT_EQ(manager.getPublicAddressFor(4001), endpoint("10.0.0.5", 4001));
    EXPECT_EQ(sockets->record->lastDestination().address(), make_address("203.0.113.7"));
    EXPECT_EQ(environment->lookups.load(), 0);
}

TEST_F(NetworkAddressManagerTest, ImplicitDestinationDoesNotWaitForRestart)
{
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<int> calls{0};
    environment->onResolve = [&](const std::string&) {
        if (++calls == 2)
        {
            entered.set_value();
            released.wait();
        }
    };

    NetworkAddressManager manager(store, collaborators());
    manager.start();

    // The second start() stalls in its lookup until released
    std::thread restart([&] { manager.start(); });
    entered.get_future().wait();

    auto lookup = std::async(std::launch::async, [&] { return manager.getPublicAddressFor(4000); });
    bool answered = lookup.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    release.set_value();
    restart.join();

    EXPECT_TRUE(answered);
    EXPECT_EQ(lookup.get().port(), 4000);
}

TEST_F(NetworkAddressManagerTest, PreferredNetworkAddress)
{
    ASSERT_TRUE(store.setProperty(ConfigKeys::PREFERRED_NETWORK_ADDRESS, std::string("192.168.1.10")));
    NetworkAddressManager manager(store, collaborators());
    manager.start();
    EXPECT_EQ(manager.getLocalHost(make_address("198.51.100.1")), make_address("192.168.1.10"));

    ASSERT_TRUE(store.setProperty(ConfigKeys::PREFERRED_NETWORK_ADDRESS, std::string("not an address")));
    manager.start();
    EXPECT_EQ(manager.getLocalHost(make_address("198.51.100.1")), make_address("10.0.0.5"));
}

TEST_F(NetworkAddressManagerTest, ConcurrentCallers)
{
    configureStun("stun.example.com", "3478");
    NetworkAddressManager manager(store, collaborators());
    manager.start();

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&, i] {
            for (int j = 0; j < 100; ++j)
            {
                uint16_t port = (i % 2 == 0) ? 4000 : 4001;
                auto expected = port == 4000 ? endpoint("1.2.3.4", 5000) : endpoint("10.0.0.5", 4001);
                if (manager.getPublicAddressFor(make_address("198.51.100.1"), port) != expected)
                    ++mismatches;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_FALSE(sockets->record->interleaved.load());
}

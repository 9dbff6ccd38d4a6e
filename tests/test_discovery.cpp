#include <gtest/gtest.h>
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>
#include "DiscoveryService.hpp"
#include "PacketCodec.hpp"

using namespace cosmic_connect;
using namespace std::chrono_literals;

namespace {
    std::string announcement(const std::string& deviceId, uint16_t port = 1716) {
        CoreConfig config;
        config.deviceName = "Device " + deviceId;
        auto identity = IdentityModel::buildLocalIdentity(config, deviceId, port, {}, {});
        return PacketCodec::encode(IdentityModel::toPacket(identity));
    }

    // Found and lost events raised on the discovery threads
    class EventLog {
    public:
        void add(const std::string& entry) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                entries_.push_back(entry);
            }
            cv_.notify_all();
        }

        bool waitFor(const std::string& entry, std::chrono::milliseconds timeout = 3000ms) {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [&] {
                return std::find(entries_.begin(), entries_.end(), entry) != entries_.end();
            });
        }

        bool waitForPrefix(const std::string& prefix, std::chrono::milliseconds timeout = 3000ms) {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [&] {
                return std::any_of(entries_.begin(), entries_.end(), [&](const std::string& entry) {
                    return entry.compare(0, prefix.size(), prefix) == 0;
                });
            });
        }

        bool waitForCount(const std::string& entry, size_t expected,
            std::chrono::milliseconds timeout = 3000ms)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [&] {
                return static_cast<size_t>(std::count(entries_.begin(), entries_.end(), entry)) >= expected;
            });
        }

        size_t count(const std::string& entry) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<size_t>(std::count(entries_.begin(), entries_.end(), entry));
        }

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        std::vector<std::string> entries_;
    };

    DiscoveryCallbacks recordingCallbacks(EventLog& log) {
        DiscoveryCallbacks callbacks;
        callbacks.onDeviceFound = [&log](const DeviceIdentity& identity, const std::string& address) {
            log.add("found:" + identity.deviceId + "@" + address);
        };
        callbacks.onDeviceLost = [&log](const std::string& deviceId) {
            log.add("lost:" + deviceId);
        };
        return callbacks;
    }

    CoreConfig fastDiscoveryConfig() {
        CoreConfig config;
        config.discoveryPort = 27716;
        config.broadcastInterval = 100ms;
        config.discoveryMissedBroadcasts = 3;
        return config;
    }

    DeviceIdentity identityFor(const std::string& deviceId, const CoreConfig& config) {
        CoreConfig named = config;
        named.deviceName = "Device " + deviceId;
        return IdentityModel::buildLocalIdentity(named, deviceId, config.minControlPort, {}, {});
    }

    // Sends one announcement straight to the discovery port on this host
    void sendToLoopback(const std::string& datagram, uint16_t port) {
        int fd = socket(AF_INET, SOCK_DGRAM, 0);
        ASSERT_GE(fd, 0);
        sockaddr_in destination{};
        destination.sin_family = AF_INET;
        destination.sin_port = htons(port);
        destination.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ssize_t sent = sendto(fd, datagram.data(), datagram.size(), 0,
            reinterpret_cast<const sockaddr*>(&destination), sizeof(destination));
        close(fd);
        ASSERT_EQ(sent, static_cast<ssize_t>(datagram.size()));
    }

    class DeviceCacheTest : public ::testing::Test {
    protected:
        void SetUp() override {
            DiscoveryCallbacks callbacks;
            callbacks.onDeviceFound = [this](const DeviceIdentity& identity, const std::string& address) {
                found.emplace_back(identity.deviceId, address);
            };
            callbacks.onDeviceLost = [this](const std::string& deviceId) {
                lost.push_back(deviceId);
            };
            cache = std::make_unique<DeviceCache>("local", 15s, 1714, 1764, std::move(callbacks));
        }

        std::unique_ptr<DeviceCache> cache;
        std::vector<std::pair<std::string, std::string>> found;
        std::vector<std::string> lost;
        DeviceCache::Clock::time_point start = DeviceCache::Clock::now();
    };
}

TEST_F(DeviceCacheTest, ReportsNewDeviceOnce) {
    EXPECT_TRUE(cache->handleDatagram(announcement("remote"), "192.168.1.20", start));
    EXPECT_TRUE(cache->handleDatagram(announcement("remote"), "192.168.1.20", start + 5s));

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].first, "remote");
    EXPECT_EQ(found[0].second, "192.168.1.20");

    auto device = cache->find("remote");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->lastSeen, start + 5s);
}

TEST_F(DeviceCacheTest, IgnoresOwnAnnouncements) {
    EXPECT_FALSE(cache->handleDatagram(announcement("local"), "127.0.0.1", start));
    EXPECT_TRUE(found.empty());
    EXPECT_TRUE(cache->devices().empty());
}

TEST_F(DeviceCacheTest, MalformedDatagramsProduceNoEvents) {
    EXPECT_FALSE(cache->handleDatagram("not json at all\n", "10.0.0.2", start));
    EXPECT_FALSE(cache->handleDatagram(R"({"type":"cconnect.identity","body":{"deviceId":"x"}})" "\n",
        "10.0.0.2", start));
    EXPECT_FALSE(cache->handleDatagram(PacketCodec::encode(Packet::create("cconnect.ping")),
        "10.0.0.2", start));
    EXPECT_FALSE(cache->handleDatagram(std::string("\x00\xff\xfe", 3), "10.0.0.2", start));

    EXPECT_TRUE(found.empty());
    EXPECT_TRUE(cache->devices().empty());
}

TEST_F(DeviceCacheTest, IgnoresControlPortOutsideRange) {
    EXPECT_FALSE(cache->handleDatagram(announcement("remote", 80), "10.0.0.3", start));
    EXPECT_FALSE(cache->handleDatagram(announcement("remote", 0), "10.0.0.3", start));
    EXPECT_TRUE(found.empty());
}

TEST_F(DeviceCacheTest, EvictsStaleDevicesExactlyOnce) {
    cache->handleDatagram(announcement("a_device"), "10.0.0.4", start);
    cache->handleDatagram(announcement("b_device"), "10.0.0.5", start + 10s);

    EXPECT_TRUE(cache->sweepExpired(start + 15s).empty());

    auto evicted = cache->sweepExpired(start + 16s);
    ASSERT_EQ(evicted, std::vector<std::string>{"a_device"});
    EXPECT_TRUE(cache->sweepExpired(start + 17s).empty());
    ASSERT_EQ(lost, std::vector<std::string>{"a_device"});

    cache->sweepExpired(start + 30s);
    EXPECT_EQ(lost, (std::vector<std::string>{"a_device", "b_device"}));
    EXPECT_TRUE(cache->devices().empty());
}

TEST_F(DeviceCacheTest, RefreshKeepsDeviceAlive) {
    cache->handleDatagram(announcement("remote"), "10.0.0.6", start);
    cache->handleDatagram(announcement("remote"), "10.0.0.6", start + 12s);

    EXPECT_TRUE(cache->sweepExpired(start + 20s).empty());
    EXPECT_TRUE(lost.empty());
}

TEST_F(DeviceCacheTest, RediscoveryAfterLossReportsAgain) {
    cache->handleDatagram(announcement("remote"), "10.0.0.7", start);
    cache->sweepExpired(start + 20s);
    cache->handleDatagram(announcement("remote"), "10.0.0.7", start + 21s);

    EXPECT_EQ(found.size(), 2u);
    EXPECT_EQ(lost.size(), 1u);
}

TEST_F(DeviceCacheTest, DevicesAreSortedById) {
    cache->handleDatagram(announcement("zeta"), "10.0.0.8", start);
    cache->handleDatagram(announcement("alpha"), "10.0.0.9", start);

    auto devices = cache->devices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].identity.deviceId, "alpha");
    EXPECT_EQ(devices[1].identity.deviceId, "zeta");
}

TEST(DiscoveryServiceTest, StopIsIdempotentBeforeStart) {
    CoreConfig config;
    DiscoveryService service(config);
    EXPECT_EQ(service.state(), DiscoveryService::State::Idle);
    service.stop();
    service.stop();
    EXPECT_FALSE(service.isRunning());
    EXPECT_TRUE(service.devices().empty());
}

TEST(DeviceCacheCallbackTest, FailingLostCallbackDoesNotHideOtherDevices) {
    std::vector<std::string> lost;
    DiscoveryCallbacks callbacks;
    callbacks.onDeviceLost = [&lost](const std::string& deviceId) {
        lost.push_back(deviceId);
        if (deviceId == "a_device") {
            throw std::runtime_error("listener failed");
        }
    };
    DeviceCache cache("local", 15s, 1714, 1764, std::move(callbacks));
    auto start = DeviceCache::Clock::now();
    cache.handleDatagram(announcement("a_device"), "10.0.0.4", start);
    cache.handleDatagram(announcement("b_device"), "10.0.0.5", start);

    std::vector<std::string> evicted;
    EXPECT_NO_THROW(evicted = cache.sweepExpired(start + 20s));
    std::sort(evicted.begin(), evicted.end());
    std::sort(lost.begin(), lost.end());
    EXPECT_EQ(evicted, (std::vector<std::string>{"a_device", "b_device"}));
    EXPECT_EQ(lost, (std::vector<std::string>{"a_device", "b_device"}));
    EXPECT_TRUE(cache.devices().empty());
}

TEST(DeviceCacheCallbackTest, FailingFoundCallbackStillRecordsDevice) {
    DiscoveryCallbacks callbacks;
    callbacks.onDeviceFound = [](const DeviceIdentity&, const std::string&) {
        throw std::runtime_error("listener failed");
    };
    DeviceCache cache("local", 15s, 1714, 1764, std::move(callbacks));

    bool accepted = false;
    EXPECT_NO_THROW(accepted = cache.handleDatagram(announcement("remote"), "10.0.0.6",
        DeviceCache::Clock::now()));
    EXPECT_TRUE(accepted);
    EXPECT_TRUE(cache.find("remote").has_value());
}

TEST(DiscoveryServiceTest, ReceivesAnnouncementsAndExpiresSilentDevices) {
    CoreConfig config = fastDiscoveryConfig();
    DiscoveryService service(config);
    EventLog log;
    if (!service.start(identityFor("alpha", config), recordingCallbacks(log))) {
        GTEST_SKIP() << "No interface can join the discovery group here";
    }
    EXPECT_EQ(service.state(), DiscoveryService::State::Broadcasting);

    std::string beta = PacketCodec::encode(IdentityModel::toPacket(identityFor("beta", config)));
    sendToLoopback(beta, config.discoveryPort);
    ASSERT_TRUE(log.waitFor("found:beta@127.0.0.1"));
    ASSERT_TRUE(service.find("beta").has_value());
    EXPECT_EQ(service.find("beta")->identity.tcpPort, config.minControlPort);

    // A repeat is a refresh, not a second discovery
    sendToLoopback(beta, config.discoveryPort);
    ASSERT_TRUE(log.waitFor("lost:beta"));
    EXPECT_EQ(log.count("found:beta@127.0.0.1"), 1u);
    EXPECT_FALSE(service.find("beta").has_value());

    service.stop();
    service.stop();
    EXPECT_EQ(service.state(), DiscoveryService::State::Stopped);
    EXPECT_TRUE(service.devices().empty());

    // A stopped service can be started again
    ASSERT_TRUE(service.start(identityFor("alpha", config), recordingCallbacks(log)));
    EXPECT_TRUE(service.isRunning());
    sendToLoopback(beta, config.discoveryPort);
    EXPECT_TRUE(log.waitForCount("found:beta@127.0.0.1", 2));
    service.stop();
}

TEST(DiscoveryServiceTest, TwoServicesOnOneHostFindEachOther) {
    CoreConfig config = fastDiscoveryConfig();
    config.discoveryPort = 27717;
    DiscoveryService alpha(config);
    DiscoveryService beta(config);
    EventLog alphaLog;
    EventLog betaLog;
    if (!alpha.start(identityFor("alpha", config), recordingCallbacks(alphaLog))) {
        GTEST_SKIP() << "No interface can join the discovery group here";
    }
    ASSERT_TRUE(beta.start(identityFor("beta", config), recordingCallbacks(betaLog)));

    if (!alphaLog.waitForPrefix("found:beta@")) {
        alpha.stop();
        beta.stop();
        GTEST_SKIP() << "Multicast is not looped back on this host";
    }
    EXPECT_TRUE(betaLog.waitForPrefix("found:alpha@"));
    EXPECT_EQ(alpha.find("beta")->identity.deviceName, "Device beta");

    beta.stop();
    EXPECT_TRUE(alphaLog.waitFor("lost:beta"));
    EXPECT_FALSE(alpha.find("beta").has_value());
    alpha.stop();
}

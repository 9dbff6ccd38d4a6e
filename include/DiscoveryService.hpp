#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>
#include <netinet/in.h>
#include "Config.hpp"
#include "DeviceIdentity.hpp"

namespace cosmic_connect {

struct DiscoveredDevice {
    DeviceIdentity identity;
    // Host the datagram came from; the control port is identity.tcpPort
    std::string address;
    std::chrono::steady_clock::time_point lastSeen;
};

struct DiscoveryCallbacks {
    std::function<void(const DeviceIdentity& identity, const std::string& address)> onDeviceFound;
    std::function<void(const std::string& deviceId)> onDeviceLost;
};

// Devices announced on the discovery channel. Time is passed in by the
// caller; callbacks run without the cache lock held.
class DeviceCache {
public:
    using Clock = std::chrono::steady_clock;

    DeviceCache(std::string localDeviceId,
        std::chrono::milliseconds expiry,
        uint16_t minPort,
        uint16_t maxPort,
        DiscoveryCallbacks callbacks);

    DeviceCache(const DeviceCache&) = delete;
    DeviceCache& operator=(const DeviceCache&) = delete;

    // False when the datagram was ignored: unparsable, not an identity, our
    // own announcement, or a control port outside the range
    bool handleDatagram(std::string_view data, const std::string& source, Clock::time_point now);

    // Evicts devices not refreshed within the expiry window; each one is
    // reported lost once. Returns the evicted ids.
    std::vector<std::string> sweepExpired(Clock::time_point now);

    std::vector<DiscoveredDevice> devices() const;
    std::optional<DiscoveredDevice> find(const std::string& deviceId) const;

private:
    std::string local_device_id_;
    std::chrono::milliseconds expiry_;
    uint16_t min_port_;
    uint16_t max_port_;
    DiscoveryCallbacks callbacks_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, DiscoveredDevice> devices_;
};

// Announces the local identity on the multicast group and listens for the
// announcements of others, on every usable interface independently.
class DiscoveryService {
public:
    enum class State {
        Idle,
        Broadcasting,
        Stopped
    };

    explicit DiscoveryService(const CoreConfig& config);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // False when no interface could be set up. Interfaces that fail are
    // logged and skipped.
    bool start(const DeviceIdentity& localIdentity, DiscoveryCallbacks callbacks);

    // Leaves the group and releases the sockets; idempotent
    void stop();

    bool isRunning() const { return state_.load() == State::Broadcasting; }
    State state() const { return state_.load(); }

    std::vector<DiscoveredDevice> devices() const;
    std::optional<DiscoveredDevice> find(const std::string& deviceId) const;

    // Takes effect with the next announcement
    void setLocalIdentity(const DeviceIdentity& identity);
    void announceNow();

private:
    static constexpr int POLL_TIMEOUT_MS = 500;

    struct InterfaceSocket {
        std::string name;
        in_addr address{};
        int fd = -1;
    };

    std::vector<InterfaceSocket> openSockets();
    bool openSocket(InterfaceSocket& entry, const in_addr& group);
    void closeSockets();

    void listenLoop(const InterfaceSocket& entry);
    void announceLoop();
    void announce();
    std::shared_ptr<DeviceCache> cache() const;

    CoreConfig config_;
    std::atomic<State> state_{State::Idle};
    std::mutex lifecycle_mutex_;

    std::mutex identity_mutex_;
    DeviceIdentity local_identity_;

    mutable std::mutex cache_mutex_;
    std::shared_ptr<DeviceCache> cache_;

    std::vector<InterfaceSocket> sockets_;
    std::vector<std::thread> listener_threads_;
    std::thread announce_thread_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool announce_requested_ = false;
};

const char* toString(DiscoveryService::State state);

} // namespace cosmic_connect

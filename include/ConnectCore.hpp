#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "CertificateManager.hpp"
#include "CertificateStorage.hpp"
#include "Config.hpp"
#include "ConnectionRegistry.hpp"
#include "DiscoveryService.hpp"
#include "NetworkStack.hpp"
#include "PairingManager.hpp"
#include "PluginRouter.hpp"
#include "TrustStore.hpp"

namespace cosmic_connect {

// Entry point for embedding applications. Wires discovery, pairing, the
// connection registry and the plugin router together around one control
// listener.
class ConnectCore {
public:
    // Without a storage the file storage under config.storageDirectory is
    // used. Throws ProtocolError(ConfigError) for an unusable configuration.
    explicit ConnectCore(const CoreConfig& config,
        std::shared_ptr<CertificateStorage> storage = nullptr);
    ~ConnectCore();

    ConnectCore(const ConnectCore&) = delete;
    ConnectCore& operator=(const ConnectCore&) = delete;

    // Loads or creates the local certificate and opens the control listener
    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Requires start(). Trusted devices that show up are connected once per
    // announcement that makes them known.
    bool startDiscovery(DiscoveryCallbacks callbacks = DiscoveryCallbacks{});
    void stopDiscovery();

    // Connects to a discovered device and asks it to pair. Blocks until the
    // remote user decided, the attempt timed out, or it was cancelled.
    PairingOutcome pair(const std::string& deviceId);

    // Control connection to an explicit address, e.g. one outside the
    // multicast domain
    PairingOutcome connectTo(const std::string& host, uint16_t port,
        const std::optional<std::string>& expectedDeviceId = std::nullopt,
        bool requestPairing = false);

    // Tells the peer when connected, forgets its certificate and closes the
    // session. False when the device was not paired.
    bool unpair(const std::string& deviceId);

    // Throws ProtocolError(DeviceNotConnected) without a live session
    void send(const std::string& deviceId, const Packet& packet);

    void registerHandler(const std::string& prefix, std::shared_ptr<PacketHandler> handler);

    void setPairRequestHandler(PairingManager::PairRequestHandler handler);
    bool acceptPairing(const std::string& deviceId);
    bool rejectPairing(const std::string& deviceId);
    bool cancelPairing(const std::string& deviceId);
    PairState pairState(const std::string& deviceId);

    std::vector<std::string> connectedDevices() const;
    std::vector<TrustedPeer> trustedPeers();
    std::vector<DiscoveredDevice> discoveredDevices() const;

    DeviceIdentity localIdentity() const;
    std::string localFingerprint() const;
    uint16_t controlPort() const { return listener_.port(); }

    std::shared_ptr<ConnectionRegistry> registry() const { return registry_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void handleIncoming(int socket, const std::string& address);
    void handleDeviceFound(const DeviceIdentity& identity, const std::string& address);
    void handleSessionPacket(const std::string& deviceId, const Packet& packet);
    void startSession(HandshakeResult result);
    void announceIdentityChange();

    void spawnWorker(std::function<void()> task);
    void reapWorkers(bool all);

    CoreConfig config_;
    std::shared_ptr<CertificateStorage> storage_;
    std::shared_ptr<CertificateManager> certificates_;
    std::shared_ptr<TrustStore> trust_store_;
    std::shared_ptr<PairingManager> pairing_;
    std::shared_ptr<ConnectionRegistry> registry_;
    std::unique_ptr<PluginRouter> router_;
    std::unique_ptr<DiscoveryService> discovery_;
    ControlListener listener_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};

    std::mutex discovery_mutex_;
    DiscoveryCallbacks discovery_callbacks_;

    std::mutex sessions_mutex_;
    std::vector<std::weak_ptr<Session>> started_sessions_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace cosmic_connect

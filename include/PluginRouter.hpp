#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "ConnectionRegistry.hpp"
#include "Packet.hpp"

namespace cosmic_connect {

// A feature module. Handlers receive packets of the device that sent them,
// in arrival order per device.
class PacketHandler {
public:
    virtual ~PacketHandler() = default;

    virtual void handlePacket(const std::string& deviceId, const Packet& packet) = 0;
    virtual void onConnected(const std::string& deviceId) { (void)deviceId; }
    virtual void onDisconnected(const std::string& deviceId) { (void)deviceId; }

    // Packet types advertised in the local identity. An empty incoming list
    // advertises the registered prefix.
    virtual std::vector<std::string> incomingCapabilities() const { return {}; }
    virtual std::vector<std::string> outgoingCapabilities() const { return {}; }
};

class PluginRouter {
public:
    explicit PluginRouter(std::shared_ptr<ConnectionRegistry> registry);
    ~PluginRouter();

    PluginRouter(const PluginRouter&) = delete;
    PluginRouter& operator=(const PluginRouter&) = delete;

    // Throws ProtocolError(InvalidParameter) for an empty or malformed
    // prefix, a prefix that is already taken, or a null handler
    void registerHandler(const std::string& prefix, std::shared_ptr<PacketHandler> handler);

    // Handler whose prefix equals the type or is a dot-delimited prefix of
    // it; the longest such prefix wins. False when the packet was dropped.
    bool routeInbound(const std::string& deviceId, const Packet& packet);

    // Throws ProtocolError(DeviceNotConnected) without a live session
    void send(const std::string& deviceId, const Packet& packet);

    std::vector<std::string> incomingCapabilities() const;
    std::vector<std::string> outgoingCapabilities() const;
    std::vector<std::string> registeredPrefixes() const;

    static bool matchesPrefix(const std::string& packetType, const std::string& prefix);

private:
    struct Registration {
        std::string prefix;
        std::shared_ptr<PacketHandler> handler;
    };

    void fanOut(ConnectionRegistry::Event event, const std::string& deviceId);
    std::vector<Registration> snapshot() const;

    std::shared_ptr<ConnectionRegistry> registry_;
    size_t observer_id_;

    mutable std::shared_mutex handlers_mutex_;
    std::vector<Registration> handlers_;
};

} // namespace cosmic_connect

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Config.hpp"
#include "CoreTypes.hpp"
#include "Packet.hpp"

namespace cosmic_connect {

// Self-description of a local or remote device
struct DeviceIdentity {
    std::string deviceId;
    std::string deviceName;
    DeviceType deviceType = DeviceType::Desktop;
    int protocolVersion = PROTOCOL_VERSION;
    std::vector<std::string> incomingCapabilities;
    std::vector<std::string> outgoingCapabilities;
    uint16_t tcpPort = 0;

    // Only set when the identity is sent over TCP to one specific device
    std::optional<std::string> targetDeviceId;
    std::optional<int> targetProtocolVersion;

    bool operator==(const DeviceIdentity& other) const;
    bool operator!=(const DeviceIdentity& other) const { return !(*this == other); }
};

class IdentityModel {
public:
    // Capabilities are sorted and deduplicated. Throws
    // ProtocolError(InvalidIdentity) for an unusable device id.
    static DeviceIdentity buildLocalIdentity(
        const CoreConfig& config,
        const std::string& deviceId,
        uint16_t tcpPort,
        std::vector<std::string> incomingCapabilities,
        std::vector<std::string> outgoingCapabilities);

    static Packet toPacket(const DeviceIdentity& identity);

    // Throws ProtocolError(InvalidIdentity) when a required field is missing
    // or protocolVersion is outside the supported range
    static DeviceIdentity fromPacket(const Packet& packet);

    static bool isValidDeviceId(const std::string& deviceId);
    static std::string sanitizeDeviceName(const std::string& name);

private:
    IdentityModel() = delete;
    ~IdentityModel() = delete;
    IdentityModel(const IdentityModel&) = delete;
    IdentityModel& operator=(const IdentityModel&) = delete;
};

} // namespace cosmic_connect

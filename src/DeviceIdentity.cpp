#include "DeviceIdentity.hpp"
#include "Utils.hpp"
#include <algorithm>

namespace cosmic_connect {

using json = nlohmann::json;

namespace {
    constexpr const char* KEY_DEVICE_ID = "deviceId";
    constexpr const char* KEY_DEVICE_NAME = "deviceName";
    constexpr const char* KEY_DEVICE_TYPE = "deviceType";
    constexpr const char* KEY_PROTOCOL_VERSION = "protocolVersion";
    constexpr const char* KEY_INCOMING = "incomingCapabilities";
    constexpr const char* KEY_OUTGOING = "outgoingCapabilities";
    constexpr const char* KEY_TCP_PORT = "tcpPort";
    constexpr const char* KEY_TARGET_DEVICE_ID = "targetDeviceId";
    constexpr const char* KEY_TARGET_PROTOCOL_VERSION = "targetProtocolVersion";

    [[noreturn]] void invalid(const std::string& reason) {
        throw ProtocolError(ErrorCode::InvalidIdentity, reason);
    }

    void normalize(std::vector<std::string>& capabilities) {
        capabilities.erase(std::remove(capabilities.begin(), capabilities.end(), std::string()),
            capabilities.end());
        std::sort(capabilities.begin(), capabilities.end());
        capabilities.erase(std::unique(capabilities.begin(), capabilities.end()),
            capabilities.end());
    }

    std::vector<std::string> readCapabilities(const json& body, const char* key) {
        std::vector<std::string> result;
        auto it = body.find(key);
        if (it == body.end() || !it->is_array()) {
            return result;
        }
        for (const auto& entry : *it) {
            if (entry.is_string()) {
                result.push_back(entry.get<std::string>());
            }
        }
        normalize(result);
        return result;
    }
}

bool DeviceIdentity::operator==(const DeviceIdentity& other) const {
    return deviceId == other.deviceId &&
        deviceName == other.deviceName &&
        deviceType == other.deviceType &&
        protocolVersion == other.protocolVersion &&
        incomingCapabilities == other.incomingCapabilities &&
        outgoingCapabilities == other.outgoingCapabilities &&
        tcpPort == other.tcpPort &&
        targetDeviceId == other.targetDeviceId &&
        targetProtocolVersion == other.targetProtocolVersion;
}

bool IdentityModel::isValidDeviceId(const std::string& deviceId) {
    return Utils::isValidIdentifier(deviceId, protocol::MAX_DEVICE_ID_LENGTH);
}

std::string IdentityModel::sanitizeDeviceName(const std::string& name) {
    std::string result = Utils::trim(name);
    if (result.size() > protocol::MAX_DEVICE_NAME_LENGTH) {
        result.resize(protocol::MAX_DEVICE_NAME_LENGTH);
        // Do not leave half of a UTF-8 sequence behind
        size_t lead = result.size();
        while (lead > 0 && (static_cast<unsigned char>(result[lead - 1]) & 0xC0) == 0x80) {
            --lead;
        }
        if (lead > 0) {
            auto byte = static_cast<unsigned char>(result[lead - 1]);
            size_t expected = byte >= 0xF0 ? 4 : byte >= 0xE0 ? 3 : byte >= 0xC0 ? 2 : 1;
            if (result.size() - (lead - 1) < expected) {
                result.resize(lead - 1);
            }
        }
        result = Utils::trim(result);
    }
    return result;
}

DeviceIdentity IdentityModel::buildLocalIdentity(
    const CoreConfig& config,
    const std::string& deviceId,
    uint16_t tcpPort,
    std::vector<std::string> incomingCapabilities,
    std::vector<std::string> outgoingCapabilities)
{
    if (!isValidDeviceId(deviceId)) {
        invalid("Local device id is not usable: '" + deviceId + "'");
    }

    DeviceIdentity identity;
    identity.deviceId = deviceId;
    identity.deviceName = sanitizeDeviceName(config.deviceName);
    if (identity.deviceName.empty()) {
        identity.deviceName = deviceId;
    }
    identity.deviceType = config.deviceType;
    identity.protocolVersion = PROTOCOL_VERSION;
    identity.tcpPort = tcpPort;

    normalize(incomingCapabilities);
    normalize(outgoingCapabilities);
    identity.incomingCapabilities = std::move(incomingCapabilities);
    identity.outgoingCapabilities = std::move(outgoingCapabilities);
    return identity;
}

Packet IdentityModel::toPacket(const DeviceIdentity& identity) {
    json body = {
        {KEY_DEVICE_ID, identity.deviceId},
        {KEY_DEVICE_NAME, identity.deviceName},
        {KEY_DEVICE_TYPE, toString(identity.deviceType)},
        {KEY_PROTOCOL_VERSION, identity.protocolVersion},
        {KEY_INCOMING, identity.incomingCapabilities},
        {KEY_OUTGOING, identity.outgoingCapabilities},
        {KEY_TCP_PORT, identity.tcpPort}
    };
    if (identity.targetDeviceId) {
        body[KEY_TARGET_DEVICE_ID] = *identity.targetDeviceId;
    }
    if (identity.targetProtocolVersion) {
        body[KEY_TARGET_PROTOCOL_VERSION] = *identity.targetProtocolVersion;
    }
    return Packet::create(protocol::PACKET_TYPE_IDENTITY, std::move(body));
}

DeviceIdentity IdentityModel::fromPacket(const Packet& packet) {
    if (packet.type != protocol::PACKET_TYPE_IDENTITY) {
        invalid("Expected identity packet, got " + packet.type);
    }

    const json& body = packet.body;
    DeviceIdentity identity;

    auto id = body.find(KEY_DEVICE_ID);
    if (id == body.end() || !id->is_string()) {
        invalid("Identity lacks deviceId");
    }
    identity.deviceId = id->get<std::string>();
    if (!isValidDeviceId(identity.deviceId)) {
        invalid("Identity carries an invalid deviceId");
    }

    auto name = body.find(KEY_DEVICE_NAME);
    if (name == body.end() || !name->is_string()) {
        invalid("Identity lacks deviceName");
    }
    identity.deviceName = sanitizeDeviceName(name->get<std::string>());
    if (identity.deviceName.empty()) {
        invalid("Identity carries an empty deviceName");
    }

    auto version = body.find(KEY_PROTOCOL_VERSION);
    if (version == body.end() || !version->is_number_integer()) {
        invalid("Identity lacks protocolVersion");
    }
    auto protocolVersion = version->get<int64_t>();
    if (protocolVersion < MIN_PROTOCOL_VERSION || protocolVersion > PROTOCOL_VERSION) {
        invalid("Unsupported protocolVersion " + std::to_string(protocolVersion));
    }
    identity.protocolVersion = static_cast<int>(protocolVersion);

    // Unknown types read as desktop
    auto type = body.find(KEY_DEVICE_TYPE);
    if (type != body.end() && type->is_string()) {
        identity.deviceType = parseDeviceType(type->get<std::string>()).value_or(DeviceType::Desktop);
    }

    auto port = body.find(KEY_TCP_PORT);
    if (port != body.end()) {
        if (!port->is_number_integer()) {
            invalid("Identity carries a non-integer tcpPort");
        }
        auto value = port->get<int64_t>();
        if (value < 0 || value > 65535) {
            invalid("Identity carries an out-of-range tcpPort");
        }
        identity.tcpPort = static_cast<uint16_t>(value);
    }

    identity.incomingCapabilities = readCapabilities(body, KEY_INCOMING);
    identity.outgoingCapabilities = readCapabilities(body, KEY_OUTGOING);

    auto target = body.find(KEY_TARGET_DEVICE_ID);
    if (target != body.end() && target->is_string()) {
        identity.targetDeviceId = target->get<std::string>();
    }
    auto targetVersion = body.find(KEY_TARGET_PROTOCOL_VERSION);
    if (targetVersion != body.end() && targetVersion->is_number_integer()) {
        identity.targetProtocolVersion = targetVersion->get<int>();
    }

    return identity;
}

} // namespace cosmic_connect

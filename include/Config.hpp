#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "CoreTypes.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"

namespace cosmic_connect {

// Every tunable of the core. Defaults follow the protocol constants.
struct CoreConfig {
    std::string deviceName = "COSMIC Device";
    DeviceType deviceType = DeviceType::Desktop;

    // Directory of the file-backed certificate and trust storage
    std::string storageDirectory;

    // Discovery channel
    std::string multicastGroup = protocol::MULTICAST_GROUP;
    uint16_t discoveryPort = protocol::DISCOVERY_PORT;
    std::chrono::milliseconds broadcastInterval = protocol::BROADCAST_INTERVAL;
    int discoveryMissedBroadcasts = protocol::DISCOVERY_MISSED_BROADCASTS;

    // Control channel
    uint16_t minControlPort = protocol::MIN_CONTROL_PORT;
    uint16_t maxControlPort = protocol::MAX_CONTROL_PORT;
    std::chrono::milliseconds handshakeTimeout = protocol::HANDSHAKE_TIMEOUT;
    std::chrono::milliseconds pairingTimeout = protocol::PAIRING_TIMEOUT;
    std::chrono::milliseconds keepaliveInterval = protocol::KEEPALIVE_INTERVAL;
    int keepaliveMissedIntervals = protocol::KEEPALIVE_MISSED_INTERVALS;
    std::chrono::milliseconds connectionRateLimit = protocol::CONNECTION_RATE_LIMIT;

    LogLevel logLevel = LogLevel::Info;
    std::string logFile;

    std::chrono::milliseconds discoveryExpiry() const {
        return broadcastInterval * discoveryMissedBroadcasts;
    }

    std::chrono::milliseconds idleTimeout() const {
        return keepaliveInterval * keepaliveMissedIntervals;
    }
};

class Config {
public:
    // Reads a JSON document and overrides the defaults it names.
    // Throws ProtocolError(ConfigError).
    static CoreConfig loadFromFile(const std::string& path);
    static CoreConfig fromJson(const nlohmann::json& document, CoreConfig base = CoreConfig{});

    // Throws ProtocolError(ConfigError) on inconsistent values
    static void validate(const CoreConfig& config);

    static bool validatePort(int port);

private:
    Config() = delete;
    ~Config() = delete;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
};

} // namespace cosmic_connect

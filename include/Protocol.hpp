#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace cosmic_connect {

// Protocol versions understood by this core
constexpr int PROTOCOL_VERSION = 8;
constexpr int MIN_PROTOCOL_VERSION = 7;

// Protocol-specific constants
namespace protocol {
    // Packet types handled by the core itself
    constexpr const char* PACKET_TYPE_IDENTITY = "cconnect.identity";
    constexpr const char* PACKET_TYPE_PAIR = "cconnect.pair";
    constexpr const char* PACKET_TYPE_KEEPALIVE = "cconnect.keepalive";

    // Discovery channel
    constexpr const char* MULTICAST_GROUP = "224.0.0.251";
    constexpr uint16_t DISCOVERY_PORT = 1716;
    constexpr int MULTICAST_TTL = 1;

    // Control channel port range
    constexpr uint16_t MIN_CONTROL_PORT = 1714;
    constexpr uint16_t MAX_CONTROL_PORT = 1764;

    // Framing limits
    constexpr size_t MAX_PACKET_SIZE = 512 * 1024;
    constexpr size_t MAX_DATAGRAM_SIZE = 64 * 1024;

    // Identity limits
    constexpr size_t MAX_DEVICE_ID_LENGTH = 64;
    constexpr size_t MAX_DEVICE_NAME_LENGTH = 32;

    // Timing defaults
    constexpr std::chrono::milliseconds BROADCAST_INTERVAL{5000};
    constexpr int DISCOVERY_MISSED_BROADCASTS = 3;
    constexpr std::chrono::milliseconds PAIRING_TIMEOUT{30000};
    constexpr std::chrono::milliseconds HANDSHAKE_TIMEOUT{10000};
    constexpr std::chrono::milliseconds KEEPALIVE_INTERVAL{10000};
    constexpr int KEEPALIVE_MISSED_INTERVALS = 3;
    constexpr std::chrono::milliseconds CONNECTION_RATE_LIMIT{1000};

    // Certificate parameters
    constexpr int CERTIFICATE_VALIDITY_DAYS = 3650;
    constexpr int CERTIFICATE_KEY_BITS = 2048;
    constexpr const char* CERTIFICATE_ORGANIZATION = "COSMIC Connect";
}

} // namespace cosmic_connect

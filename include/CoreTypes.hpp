#pragma once // Ensures this header is included only once during compilation

#include <string>    // Provides the std::string type
#include <stdexcept> // Provides std::runtime_error
#include <cstdint>   // Provides fixed-width integer types like uint16_t
#include <optional>
#include <string_view>

namespace cosmic_connect { // Begin namespace cosmic_connect to group related functionality

// Error codes for the protocol core
enum class ErrorCode {
    None = 0,
    MalformedPacket,
    InvalidIdentity,
    UntrustedCertificate,
    DeviceNotConnected,
    PairingTimeout,
    PairingRejected,
    PairingCancelled,
    SelfPairing,
    ProtocolDowngrade,
    CertificateError,
    StorageError,
    NetworkError,
    InvalidParameter,
    ConfigError
};

// Converts an ErrorCode to a human-readable string
inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "No error";
        case ErrorCode::MalformedPacket:
            return "Malformed Packet"; // Frame is not JSON or lacks a type
        case ErrorCode::InvalidIdentity:
            return "Invalid Identity"; // Identity fields missing or out of range
        case ErrorCode::UntrustedCertificate:
            return "Untrusted Certificate"; // Paired device presented another certificate
        case ErrorCode::DeviceNotConnected:
            return "Device Not Connected";
        case ErrorCode::PairingTimeout:
            return "Pairing Timeout";
        case ErrorCode::PairingRejected:
            return "Pairing Rejected";
        case ErrorCode::PairingCancelled:
            return "Pairing Cancelled";
        case ErrorCode::SelfPairing:
            return "Self Pairing"; // Local and remote ids are equal
        case ErrorCode::ProtocolDowngrade:
            return "Protocol Downgrade";
        case ErrorCode::CertificateError:
            return "Certificate Error";
        case ErrorCode::StorageError:
            return "Storage Error";
        case ErrorCode::NetworkError:
            return "Network Error";
        case ErrorCode::InvalidParameter:
            return "Invalid Parameter";
        case ErrorCode::ConfigError:
            return "Config Error";
        default:
            return "Unknown error";
    }
}

// Exception carrying an ErrorCode through the core
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Negotiated TLS role of one side of a connection
enum class TlsRole : uint8_t {
    Server = 0,
    Client = 1
};

inline const char* toString(TlsRole role) {
    return role == TlsRole::Server ? "server" : "client";
}

// Informational device class advertised in identities
enum class DeviceType : uint8_t {
    Desktop = 0,
    Laptop,
    Phone,
    Tablet,
    Tv
};

inline const char* toString(DeviceType type) {
    switch (type) {
        case DeviceType::Laptop: return "laptop";
        case DeviceType::Phone:  return "phone";
        case DeviceType::Tablet: return "tablet";
        case DeviceType::Tv:     return "tv";
        case DeviceType::Desktop:
        default:                 return "desktop";
    }
}

inline std::optional<DeviceType> parseDeviceType(std::string_view name) {
    if (name == "desktop") return DeviceType::Desktop;
    if (name == "laptop")  return DeviceType::Laptop;
    if (name == "phone")   return DeviceType::Phone;
    if (name == "tablet")  return DeviceType::Tablet;
    if (name == "tv")      return DeviceType::Tv;
    return std::nullopt;
}

} // namespace cosmic_connect

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "CertificateStorage.hpp"
#include "Utils.hpp"

namespace cosmic_connect {

// A remote device the user paired with
struct TrustedPeer {
    std::string deviceId;
    std::string certificateFingerprint;
    std::string displayName;
    int protocolVersion = 0;

    bool operator==(const TrustedPeer& other) const {
        return deviceId == other.deviceId &&
            certificateFingerprint == other.certificateFingerprint &&
            displayName == other.displayName &&
            protocolVersion == other.protocolVersion;
    }
};

// Persisted trust records, at most one fingerprint per device id. Records
// are serialized per device id; different devices never contend.
class TrustStore {
public:
    static constexpr const char* KEY_PREFIX = "trusted/";
    static constexpr const char* KEY_INDEX = "trusted_index";

    explicit TrustStore(std::shared_ptr<CertificateStorage> storage);

    TrustStore(const TrustStore&) = delete;
    TrustStore& operator=(const TrustStore&) = delete;

    // Records a newly paired peer. Re-adding the same fingerprint updates
    // the name and version; a different fingerprint for a trusted id throws
    // ProtocolError(UntrustedCertificate).
    void add(const TrustedPeer& peer);

    std::optional<TrustedPeer> find(const std::string& deviceId);
    bool isTrusted(const std::string& deviceId);

    // Raises the recorded protocol version after a successful reconnect
    void updateProtocolVersion(const std::string& deviceId, int protocolVersion);

    // True when a record existed
    bool remove(const std::string& deviceId);

    std::vector<TrustedPeer> list();

private:
    std::optional<TrustedPeer> loadPeer(const std::string& deviceId);
    void storePeer(const TrustedPeer& peer);
    // Callers hold index_mutex_
    std::vector<std::string> loadIndex();
    void updateIndex(const std::string& deviceId, bool present);

    static std::string keyFor(const std::string& deviceId);

    std::shared_ptr<CertificateStorage> storage_;
    KeyedMutex peer_locks_;
    std::mutex index_mutex_;
};

} // namespace cosmic_connect

#include "TrustStore.hpp"
#include "CoreTypes.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace cosmic_connect {

using json = nlohmann::json;

namespace {
    std::vector<uint8_t> toBytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    json peerToJson(const TrustedPeer& peer) {
        return json{
            {"deviceId", peer.deviceId},
            {"certificateFingerprint", peer.certificateFingerprint},
            {"displayName", peer.displayName},
            {"protocolVersion", peer.protocolVersion}
        };
    }

    TrustedPeer peerFromJson(const json& document) {
        TrustedPeer peer;
        peer.deviceId = document.at("deviceId").get<std::string>();
        peer.certificateFingerprint = document.at("certificateFingerprint").get<std::string>();
        peer.displayName = document.value("displayName", peer.deviceId);
        peer.protocolVersion = document.value("protocolVersion", MIN_PROTOCOL_VERSION);
        return peer;
    }
}

TrustStore::TrustStore(std::shared_ptr<CertificateStorage> storage)
    : storage_(std::move(storage)) {
    if (!storage_) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Trust storage is required");
    }
}

std::string TrustStore::keyFor(const std::string& deviceId) {
    if (!Utils::isValidIdentifier(deviceId, protocol::MAX_DEVICE_ID_LENGTH)) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Invalid device id: " + deviceId);
    }
    return KEY_PREFIX + deviceId;
}

void TrustStore::add(const TrustedPeer& peer) {
    if (peer.certificateFingerprint.empty()) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Trusted peer needs a fingerprint");
    }

    auto lockHandle = peer_locks_.get(peer.deviceId);
    std::lock_guard<std::mutex> lock(*lockHandle);

    auto existing = loadPeer(peer.deviceId);
    if (existing && existing->certificateFingerprint != peer.certificateFingerprint) {
        Logger::logEvent(LogLevel::Security, "Refusing to replace the trusted certificate of " +
            peer.deviceId + " without unpairing first");
        throw ProtocolError(ErrorCode::UntrustedCertificate,
            "Device " + peer.deviceId + " is already trusted with another certificate");
    }

    storePeer(peer);
    updateIndex(peer.deviceId, true);

    if (!existing) {
        Logger::logEvent(LogLevel::Security, "Trusted device " + peer.deviceId +
            " (" + peer.displayName + ")");
    }
}

std::optional<TrustedPeer> TrustStore::find(const std::string& deviceId) {
    auto lockHandle = peer_locks_.get(deviceId);
    std::lock_guard<std::mutex> lock(*lockHandle);
    return loadPeer(deviceId);
}

bool TrustStore::isTrusted(const std::string& deviceId) {
    return find(deviceId).has_value();
}

void TrustStore::updateProtocolVersion(const std::string& deviceId, int protocolVersion) {
    auto lockHandle = peer_locks_.get(deviceId);
    std::lock_guard<std::mutex> lock(*lockHandle);

    auto peer = loadPeer(deviceId);
    if (peer && protocolVersion > peer->protocolVersion) {
        peer->protocolVersion = protocolVersion;
        storePeer(*peer);
    }
}

bool TrustStore::remove(const std::string& deviceId) {
    auto lockHandle = peer_locks_.get(deviceId);
    std::lock_guard<std::mutex> lock(*lockHandle);

    bool existed = loadPeer(deviceId).has_value();
    storage_->remove(keyFor(deviceId));
    updateIndex(deviceId, false);

    if (existed) {
        Logger::logEvent(LogLevel::Security, "Removed trust for device " + deviceId);
    }
    return existed;
}

std::vector<TrustedPeer> TrustStore::list() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        ids = loadIndex();
    }

    std::vector<TrustedPeer> peers;
    for (const auto& deviceId : ids) {
        if (auto peer = find(deviceId)) {
            peers.push_back(std::move(*peer));
        }
    }
    return peers;
}

std::optional<TrustedPeer> TrustStore::loadPeer(const std::string& deviceId) {
    auto bytes = storage_->load(keyFor(deviceId));
    if (!bytes) {
        return std::nullopt;
    }

    try {
        TrustedPeer peer = peerFromJson(json::parse(bytes->begin(), bytes->end()));
        if (peer.deviceId != deviceId || peer.certificateFingerprint.empty()) {
            Logger::logEvent(LogLevel::Security, "Trust record of " + deviceId + " is inconsistent");
            return std::nullopt;
        }
        return peer;
    }
    catch (const json::exception& e) {
        Logger::logError(ErrorCode::StorageError,
            "Trust record of " + deviceId + " is unreadable: " + e.what());
        return std::nullopt;
    }
}

void TrustStore::storePeer(const TrustedPeer& peer) {
    storage_->store(keyFor(peer.deviceId), toBytes(peerToJson(peer).dump()));
}

std::vector<std::string> TrustStore::loadIndex() {
    std::vector<std::string> ids;
    auto bytes = storage_->load(KEY_INDEX);
    if (!bytes) {
        return ids;
    }
    try {
        json document = json::parse(bytes->begin(), bytes->end());
        for (const auto& entry : document) {
            if (entry.is_string()) {
                ids.push_back(entry.get<std::string>());
            }
        }
    }
    catch (const json::exception& e) {
        Logger::logError(ErrorCode::StorageError,
            std::string("Trust index is unreadable: ") + e.what());
    }
    return ids;
}

void TrustStore::updateIndex(const std::string& deviceId, bool present) {
    std::lock_guard<std::mutex> lock(index_mutex_);

    std::vector<std::string> ids = loadIndex();
    auto it = std::find(ids.begin(), ids.end(), deviceId);
    if (present == (it != ids.end())) {
        return;
    }
    if (present) {
        ids.push_back(deviceId);
        std::sort(ids.begin(), ids.end());
    } else {
        ids.erase(it);
    }
    storage_->store(KEY_INDEX, toBytes(json(ids).dump()));
}

} // namespace cosmic_connect

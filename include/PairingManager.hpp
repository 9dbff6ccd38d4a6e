#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "CertificateManager.hpp"
#include "Config.hpp"
#include "CoreTypes.hpp"
#include "DeviceIdentity.hpp"
#include "PacketCodec.hpp"
#include "Transport.hpp"
#include "TrustStore.hpp"

namespace cosmic_connect {

enum class PairState {
    Unpaired,
    PairRequestedOutgoing,
    PairRequestedIncoming,
    Paired
};

const char* toString(PairState state);

// Shown to the user of the responding device
struct PairingRequest {
    std::string deviceId;
    std::string deviceName;
    std::string fingerprint;
    // Same value on both devices when no one is in the middle
    std::string verificationKey;
};

struct PairingOutcome {
    PairState state = PairState::Unpaired;
    ErrorCode error = ErrorCode::None;
    std::string message;

    bool success() const { return error == ErrorCode::None && state == PairState::Paired; }
};

// Authenticated connection produced by a successful handshake
struct HandshakeResult {
    DeviceIdentity remoteIdentity;
    std::shared_ptr<Transport> transport;
    TlsRole role = TlsRole::Client;
    std::string peerFingerprint;
    bool newlyPaired = false;
    // Bytes that arrived after the handshake packets
    std::string pendingData;
};

struct HandshakeOptions {
    // Device the caller meant to reach; a different peer is refused
    std::optional<std::string> expectedDeviceId;
    // Send a pair request when the peer is not trusted yet
    bool requestPairing = false;
};

class PairingManager {
public:
    using PairRequestHandler = std::function<void(const PairingRequest&)>;

    PairingManager(const CoreConfig& config,
        std::shared_ptr<CertificateManager> certificates,
        std::shared_ptr<TrustStore> trustStore);

    PairingManager(const PairingManager&) = delete;
    PairingManager& operator=(const PairingManager&) = delete;

    // The device whose id sorts greater is the TLS server. Throws
    // ProtocolError(SelfPairing) for equal ids.
    static TlsRole determineRole(const std::string& localDeviceId, const std::string& remoteDeviceId);

    // Called on the handshake thread; answer with acceptPairing or
    // rejectPairing, from any thread
    void setPairRequestHandler(PairRequestHandler handler);

    // Runs the whole handshake on a connected socket and takes ownership of
    // it. Throws ProtocolError; the socket is closed on failure and no trust
    // is recorded unless pairing completed.
    HandshakeResult handshake(int socket,
        const std::string& peerAddress,
        const DeviceIdentity& localIdentity,
        const HandshakeOptions& options = HandshakeOptions{});

    // False when no incoming request is waiting for this device
    bool acceptPairing(const std::string& deviceId);
    bool rejectPairing(const std::string& deviceId);

    // Aborts an attempt in any phase; false when none is running
    bool cancelPairing(const std::string& deviceId);
    void cancelAll();

    PairState pairState(const std::string& deviceId);

    static Packet makePairRequest(const std::string& fingerprint, const std::string& deviceName);
    static Packet makePairResponse(bool accepted);
    static Packet makeUnpair();

private:
    static constexpr std::chrono::milliseconds POLL_SLICE{100};

    struct Attempt {
        std::mutex mutex;
        PairState state = PairState::Unpaired;
        bool cancelled = false;
        std::optional<bool> decision;
        int socket = -1;
        std::shared_ptr<Transport> transport;

        void cancel();
        bool isCancelled();
        void setState(PairState newState);
    };

    std::shared_ptr<Attempt> beginAttempt(const std::string& deviceId, int socket);
    void endAttempt(const std::string& deviceId, const std::shared_ptr<Attempt>& attempt);
    std::shared_ptr<Attempt> findAttempt(const std::string& deviceId);
    bool decide(const std::string& deviceId, bool accepted);

    std::optional<Packet> readPacket(Transport& transport, PacketReader& reader,
        std::chrono::steady_clock::time_point deadline, Attempt& attempt);

    void verifyTrustedPeer(const TrustedPeer& peer, const DeviceIdentity& remote,
        const std::string& fingerprint);
    void requestPairing(HandshakeResult& result, PacketReader& reader, Attempt& attempt,
        const std::string& localFingerprint, const DeviceIdentity& localIdentity);
    void respondToPairing(HandshakeResult& result, PacketReader& reader, Attempt& attempt,
        const std::string& localFingerprint);
    void persistTrust(HandshakeResult& result, Attempt& attempt);

    CoreConfig config_;
    std::shared_ptr<CertificateManager> certificates_;
    std::shared_ptr<TrustStore> trust_store_;

    std::mutex handler_mutex_;
    PairRequestHandler pair_request_handler_;

    std::mutex attempts_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Attempt>> attempts_;
};

} // namespace cosmic_connect

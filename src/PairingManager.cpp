#include "PairingManager.hpp"
#include "Crypto.hpp"
#include "Logger.hpp"
#include "NetworkStack.hpp"
#include "TlsTransport.hpp"
#include <algorithm>

namespace cosmic_connect {

namespace {
    constexpr const char* KEY_PAIR = "pair";
    constexpr const char* KEY_RESPONSE = "response";
    constexpr const char* KEY_FINGERPRINT = "fingerprint";
    constexpr const char* KEY_DEVICE_NAME = "deviceName";

    // Closes the socket unless ownership was handed on
    class SocketGuard {
    public:
        explicit SocketGuard(int socket) : socket_(socket) {}
        ~SocketGuard() { NetworkStack::closeSocket(socket_); }
        SocketGuard(const SocketGuard&) = delete;
        SocketGuard& operator=(const SocketGuard&) = delete;

        int release() {
            int socket = socket_;
            socket_ = -1;
            return socket;
        }

    private:
        int socket_;
    };

    void sendQuietly(Transport& transport, const Packet& packet, const std::string& deviceId) {
        try {
            transport.write(PacketCodec::encode(packet));
        }
        catch (const ProtocolError& e) {
            Logger::logPacket(LogLevel::Debug, deviceId, packet.type,
                std::string("Could not deliver: ") + e.what());
        }
    }
}

const char* toString(PairState state) {
    switch (state) {
        case PairState::Unpaired:              return "unpaired";
        case PairState::PairRequestedOutgoing: return "requested-outgoing";
        case PairState::PairRequestedIncoming: return "requested-incoming";
        case PairState::Paired:                return "paired";
        default:                               return "unknown";
    }
}

void PairingManager::Attempt::cancel() {
    std::shared_ptr<Transport> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancelled = true;
        toClose = transport;
        if (!toClose) {
            NetworkStack::shutdownSocket(socket);
        }
    }
    if (toClose) {
        toClose->close();
    }
}

bool PairingManager::Attempt::isCancelled() {
    std::lock_guard<std::mutex> lock(mutex);
    return cancelled;
}

void PairingManager::Attempt::setState(PairState newState) {
    std::lock_guard<std::mutex> lock(mutex);
    state = newState;
}

PairingManager::PairingManager(const CoreConfig& config,
    std::shared_ptr<CertificateManager> certificates,
    std::shared_ptr<TrustStore> trustStore)
    : config_(config),
      certificates_(std::move(certificates)),
      trust_store_(std::move(trustStore)) {
    if (!certificates_ || !trust_store_) {
        throw ProtocolError(ErrorCode::InvalidParameter,
            "Pairing needs a certificate manager and a trust store");
    }
}

TlsRole PairingManager::determineRole(const std::string& localDeviceId, const std::string& remoteDeviceId) {
    if (localDeviceId == remoteDeviceId) {
        throw ProtocolError(ErrorCode::SelfPairing,
            "Refusing to pair device " + localDeviceId + " with itself");
    }
    return localDeviceId > remoteDeviceId ? TlsRole::Server : TlsRole::Client;
}

void PairingManager::setPairRequestHandler(PairRequestHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    pair_request_handler_ = std::move(handler);
}

HandshakeResult PairingManager::handshake(int socket,
    const std::string& peerAddress,
    const DeviceIdentity& localIdentity,
    const HandshakeOptions& options)
{
    SocketGuard guard(socket);
    auto certificate = certificates_->getOrCreateLocalCertificate();

    // 1. Plaintext identities, so both sides know each other's id before TLS
    DeviceIdentity announced = localIdentity;
    if (options.expectedDeviceId) {
        announced.targetDeviceId = *options.expectedDeviceId;
        announced.targetProtocolVersion = PROTOCOL_VERSION;
    }
    NetworkStack::sendAll(socket, PacketCodec::encode(IdentityModel::toPacket(announced)),
        config_.handshakeTimeout);

    auto line = NetworkStack::readLine(socket, protocol::MAX_PACKET_SIZE, config_.handshakeTimeout);
    if (!line) {
        throw ProtocolError(ErrorCode::NetworkError,
            "Connection from " + peerAddress + " closed before identity");
    }
    DeviceIdentity remote = IdentityModel::fromPacket(PacketCodec::decode(*line));

    if (remote.targetDeviceId && *remote.targetDeviceId != localIdentity.deviceId) {
        throw ProtocolError(ErrorCode::InvalidIdentity,
            "Identity from " + peerAddress + " is addressed to " + *remote.targetDeviceId);
    }
    if (options.expectedDeviceId && remote.deviceId != *options.expectedDeviceId) {
        throw ProtocolError(ErrorCode::InvalidIdentity,
            "Expected device " + *options.expectedDeviceId + " at " + peerAddress +
            ", found " + remote.deviceId);
    }

    // 2. TLS in the role both sides derive from the two ids
    TlsRole role = determineRole(localIdentity.deviceId, remote.deviceId);
    auto attempt = beginAttempt(remote.deviceId, socket);

    HandshakeResult result;
    result.role = role;

    try {
        auto tls = TlsTransport::establish(guard.release(), role, *certificate,
            peerAddress, config_.handshakeTimeout);
        result.transport = tls;
        {
            std::lock_guard<std::mutex> lock(attempt->mutex);
            attempt->transport = tls;
            attempt->socket = -1;
            if (attempt->cancelled) {
                throw ProtocolError(ErrorCode::PairingCancelled,
                    "Handshake with " + remote.deviceId + " was cancelled");
            }
        }
        result.peerFingerprint = CertificateManager::fingerprint(tls->peerCertificate());
        std::string issuedTo = Crypto::certificateCommonName(tls->peerCertificate());
        if (issuedTo != remote.deviceId) {
            Logger::logEvent(LogLevel::Security, "Certificate from " + peerAddress +
                " is issued to '" + issuedTo + "', not " + remote.deviceId);
            throw ProtocolError(ErrorCode::UntrustedCertificate,
                "Certificate of " + remote.deviceId + " names another device");
        }

        // 3. Identities again, now that nobody can alter them in transit
        PacketReader reader;
        tls->write(PacketCodec::encode(IdentityModel::toPacket(localIdentity)));
        auto packet = readPacket(*tls, reader,
            std::chrono::steady_clock::now() + config_.handshakeTimeout, *attempt);
        if (!packet) {
            throw ProtocolError(ErrorCode::NetworkError,
                "Timed out waiting for the secure identity of " + remote.deviceId);
        }
        DeviceIdentity secure = IdentityModel::fromPacket(*packet);
        if (secure.deviceId != remote.deviceId || secure.protocolVersion != remote.protocolVersion) {
            Logger::logEvent(LogLevel::Security, "Device " + remote.deviceId +
                " changed its identity after TLS, aborting");
            throw ProtocolError(ErrorCode::InvalidIdentity,
                "Identity of " + remote.deviceId + " changed after TLS");
        }
        if (secure.tcpPort == 0) {
            secure.tcpPort = remote.tcpPort;
        }
        result.remoteIdentity = secure;

        // 4. Trust: known fingerprint, or a fresh pairing confirmed by the user
        if (auto trusted = trust_store_->find(secure.deviceId)) {
            verifyTrustedPeer(*trusted, secure, result.peerFingerprint);
            attempt->setState(PairState::Paired);
        } else if (options.requestPairing) {
            requestPairing(result, reader, *attempt, certificate->fingerprint, localIdentity);
        } else {
            respondToPairing(result, reader, *attempt, certificate->fingerprint);
        }

        result.pendingData = reader.takeBuffered();
    }
    catch (const ProtocolError& e) {
        bool cancelled = attempt->isCancelled();
        if (result.transport) {
            result.transport->close();
        }
        endAttempt(remote.deviceId, attempt);
        if (cancelled && e.code() != ErrorCode::PairingCancelled) {
            throw ProtocolError(ErrorCode::PairingCancelled,
                "Handshake with " + remote.deviceId + " was cancelled");
        }
        throw;
    }
    catch (const std::exception&) {
        if (result.transport) {
            result.transport->close();
        }
        endAttempt(remote.deviceId, attempt);
        throw;
    }

    endAttempt(remote.deviceId, attempt);
    Logger::logEvent(LogLevel::Info, "Authenticated " + result.remoteIdentity.deviceName +
        " (" + result.remoteIdentity.deviceId + ") as TLS " + toString(role));
    return result;
}

std::optional<Packet> PairingManager::readPacket(Transport& transport, PacketReader& reader,
    std::chrono::steady_clock::time_point deadline, Attempt& attempt)
{
    while (true) {
        if (attempt.isCancelled()) {
            throw ProtocolError(ErrorCode::PairingCancelled, "Pairing was cancelled");
        }
        if (auto packet = reader.next()) {
            return packet;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        auto wait = std::min<std::chrono::milliseconds>(POLL_SLICE,
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
            std::chrono::milliseconds(1));

        auto received = transport.read(wait);
        switch (received.status) {
            case Transport::ReadStatus::Data:
                reader.feed(received.data);
                break;
            case Transport::ReadStatus::Timeout:
                break;
            case Transport::ReadStatus::Closed:
                if (attempt.isCancelled()) {
                    throw ProtocolError(ErrorCode::PairingCancelled, "Pairing was cancelled");
                }
                throw ProtocolError(ErrorCode::NetworkError, "Connection closed during handshake");
        }
    }
}

void PairingManager::verifyTrustedPeer(const TrustedPeer& peer, const DeviceIdentity& remote,
    const std::string& fingerprint)
{
    if (peer.certificateFingerprint != fingerprint) {
        Logger::logEvent(LogLevel::Security, "Paired device " + remote.deviceId +
            " presented an unknown certificate " + CertificateManager::formatFingerprint(fingerprint) +
            "; refusing the connection");
        throw ProtocolError(ErrorCode::UntrustedCertificate,
            "Certificate of " + remote.deviceId + " does not match the paired one");
    }
    if (remote.protocolVersion < peer.protocolVersion) {
        Logger::logEvent(LogLevel::Security, "Paired device " + remote.deviceId +
            " downgraded from protocol " + std::to_string(peer.protocolVersion) +
            " to " + std::to_string(remote.protocolVersion) + "; refusing the connection");
        throw ProtocolError(ErrorCode::ProtocolDowngrade,
            "Protocol downgrade refused for " + remote.deviceId);
    }
    trust_store_->updateProtocolVersion(remote.deviceId, remote.protocolVersion);
}

void PairingManager::requestPairing(HandshakeResult& result, PacketReader& reader, Attempt& attempt,
    const std::string& localFingerprint, const DeviceIdentity& localIdentity)
{
    const std::string& deviceId = result.remoteIdentity.deviceId;
    Transport& transport = *result.transport;

    attempt.setState(PairState::PairRequestedOutgoing);
    transport.write(PacketCodec::encode(makePairRequest(localFingerprint, localIdentity.deviceName)));
    Logger::logPacket(LogLevel::Info, deviceId, protocol::PACKET_TYPE_PAIR,
        "Pair request sent, verification key " +
        CertificateManager::verificationKey(localFingerprint, result.peerFingerprint));

    auto deadline = std::chrono::steady_clock::now() + config_.pairingTimeout;
    while (true) {
        auto packet = readPacket(transport, reader, deadline, attempt);
        if (!packet) {
            sendQuietly(transport, makeUnpair(), deviceId);
            throw ProtocolError(ErrorCode::PairingTimeout,
                "No pairing answer from " + deviceId);
        }
        if (packet->type != protocol::PACKET_TYPE_PAIR) {
            Logger::logPacket(LogLevel::Debug, deviceId, packet->type, "Ignored while pairing");
            continue;
        }
        if (!packet->getBool(KEY_PAIR)) {
            throw ProtocolError(ErrorCode::PairingRejected,
                "Pairing rejected by " + deviceId);
        }
        if (!packet->getBool(KEY_RESPONSE)) {
            // Both sides asked at the same time
            transport.write(PacketCodec::encode(makePairResponse(true)));
        }
        break;
    }

    persistTrust(result, attempt);
}

void PairingManager::respondToPairing(HandshakeResult& result, PacketReader& reader, Attempt& attempt,
    const std::string& localFingerprint)
{
    const DeviceIdentity& remote = result.remoteIdentity;
    Transport& transport = *result.transport;

    // Wait for the initiator's request
    auto deadline = std::chrono::steady_clock::now() + config_.pairingTimeout;
    while (true) {
        auto packet = readPacket(transport, reader, deadline, attempt);
        if (!packet) {
            throw ProtocolError(ErrorCode::PairingTimeout,
                "No pair request from untrusted device " + remote.deviceId);
        }
        if (packet->type == protocol::PACKET_TYPE_KEEPALIVE) {
            continue;
        }
        if (packet->type == protocol::PACKET_TYPE_PAIR) {
            if (!packet->getBool(KEY_PAIR)) {
                throw ProtocolError(ErrorCode::PairingCancelled,
                    "Device " + remote.deviceId + " withdrew its pair request");
            }
            if (packet->getBool(KEY_RESPONSE)) {
                continue;
            }
            break;
        }

        // The peer still believes it is paired with us
        Logger::logPacket(LogLevel::Security, remote.deviceId, packet->type,
            "Untrusted device sent a feature packet, telling it that it is not paired");
        sendQuietly(transport, makeUnpair(), remote.deviceId);
        throw ProtocolError(ErrorCode::PairingRejected,
            "Device " + remote.deviceId + " is not paired");
    }

    PairingRequest request;
    request.deviceId = remote.deviceId;
    request.deviceName = remote.deviceName;
    request.fingerprint = result.peerFingerprint;
    request.verificationKey = CertificateManager::verificationKey(localFingerprint, result.peerFingerprint);

    attempt.setState(PairState::PairRequestedIncoming);
    Logger::logPacket(LogLevel::Info, remote.deviceId, protocol::PACKET_TYPE_PAIR,
        "Pair request received, verification key " + request.verificationKey);

    PairRequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = pair_request_handler_;
    }
    if (handler) {
        try {
            handler(request);
        }
        catch (const std::exception& e) {
            Logger::logError(ErrorCode::PairingRejected,
                std::string("Pair request handler failed: ") + e.what());
            decide(remote.deviceId, false);
        }
    } else {
        Logger::logEvent(LogLevel::Warning, "No pair request handler registered, rejecting " +
            remote.deviceId);
        decide(remote.deviceId, false);
    }

    // Wait for the local user while watching the connection
    deadline = std::chrono::steady_clock::now() + config_.pairingTimeout;
    bool accepted = false;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(attempt.mutex);
            if (attempt.decision) {
                accepted = *attempt.decision;
                break;
            }
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            sendQuietly(transport, makePairResponse(false), remote.deviceId);
            throw ProtocolError(ErrorCode::PairingTimeout,
                "Pair request from " + remote.deviceId + " was not answered");
        }
        auto packet = readPacket(transport, reader, std::min(now + POLL_SLICE, deadline), attempt);
        if (packet && packet->type == protocol::PACKET_TYPE_PAIR && !packet->getBool(KEY_PAIR)) {
            throw ProtocolError(ErrorCode::PairingCancelled,
                "Device " + remote.deviceId + " cancelled its pair request");
        }
    }

    transport.write(PacketCodec::encode(makePairResponse(accepted)));
    if (!accepted) {
        throw ProtocolError(ErrorCode::PairingRejected,
            "Pair request from " + remote.deviceId + " rejected");
    }

    persistTrust(result, attempt);
}

void PairingManager::persistTrust(HandshakeResult& result, Attempt& attempt) {
    std::lock_guard<std::mutex> lock(attempt.mutex);
    if (attempt.cancelled) {
        throw ProtocolError(ErrorCode::PairingCancelled,
            "Pairing with " + result.remoteIdentity.deviceId + " was cancelled");
    }

    TrustedPeer peer;
    peer.deviceId = result.remoteIdentity.deviceId;
    peer.certificateFingerprint = result.peerFingerprint;
    peer.displayName = result.remoteIdentity.deviceName;
    peer.protocolVersion = result.remoteIdentity.protocolVersion;
    trust_store_->add(peer);

    attempt.state = PairState::Paired;
    result.newlyPaired = true;
}

std::shared_ptr<PairingManager::Attempt> PairingManager::beginAttempt(const std::string& deviceId, int socket) {
    auto attempt = std::make_shared<Attempt>();
    attempt->socket = socket;

    std::shared_ptr<Attempt> stale;
    {
        std::lock_guard<std::mutex> lock(attempts_mutex_);
        auto& slot = attempts_[deviceId];
        stale = slot;
        slot = attempt;
    }

    if (stale) {
        Logger::logEvent(LogLevel::Info, "New connection from " + deviceId +
            " replaces the attempt in progress");
        stale->cancel();
    }
    return attempt;
}

void PairingManager::endAttempt(const std::string& deviceId, const std::shared_ptr<Attempt>& attempt) {
    {
        // The socket is about to be closed; cancel() must not touch it anymore
        std::lock_guard<std::mutex> lock(attempt->mutex);
        attempt->socket = -1;
    }

    std::lock_guard<std::mutex> lock(attempts_mutex_);
    auto it = attempts_.find(deviceId);
    if (it != attempts_.end() && it->second == attempt) {
        attempts_.erase(it);
    }
}

std::shared_ptr<PairingManager::Attempt> PairingManager::findAttempt(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(attempts_mutex_);
    auto it = attempts_.find(deviceId);
    return it == attempts_.end() ? nullptr : it->second;
}

bool PairingManager::decide(const std::string& deviceId, bool accepted) {
    auto attempt = findAttempt(deviceId);
    if (!attempt) {
        return false;
    }

    std::lock_guard<std::mutex> lock(attempt->mutex);
    if (attempt->cancelled || attempt->decision ||
        attempt->state != PairState::PairRequestedIncoming) {
        return false;
    }
    attempt->decision = accepted;
    return true;
}

bool PairingManager::acceptPairing(const std::string& deviceId) {
    return decide(deviceId, true);
}

bool PairingManager::rejectPairing(const std::string& deviceId) {
    return decide(deviceId, false);
}

bool PairingManager::cancelPairing(const std::string& deviceId) {
    auto attempt = findAttempt(deviceId);
    if (!attempt) {
        return false;
    }
    Logger::logEvent(LogLevel::Info, "Cancelling pairing with " + deviceId);
    attempt->cancel();
    return true;
}

void PairingManager::cancelAll() {
    std::vector<std::shared_ptr<Attempt>> running;
    {
        std::lock_guard<std::mutex> lock(attempts_mutex_);
        for (const auto& [deviceId, attempt] : attempts_) {
            running.push_back(attempt);
        }
    }
    for (const auto& attempt : running) {
        attempt->cancel();
    }
}

PairState PairingManager::pairState(const std::string& deviceId) {
    if (auto attempt = findAttempt(deviceId)) {
        std::lock_guard<std::mutex> lock(attempt->mutex);
        if (attempt->state != PairState::Unpaired) {
            return attempt->state;
        }
    }
    return trust_store_->isTrusted(deviceId) ? PairState::Paired : PairState::Unpaired;
}

Packet PairingManager::makePairRequest(const std::string& fingerprint, const std::string& deviceName) {
    return Packet::create(protocol::PACKET_TYPE_PAIR, {
        {KEY_PAIR, true},
        {KEY_FINGERPRINT, fingerprint},
        {KEY_DEVICE_NAME, deviceName}
    });
}

Packet PairingManager::makePairResponse(bool accepted) {
    return Packet::create(protocol::PACKET_TYPE_PAIR, {
        {KEY_PAIR, accepted},
        {KEY_RESPONSE, true}
    });
}

Packet PairingManager::makeUnpair() {
    return Packet::create(protocol::PACKET_TYPE_PAIR, {{KEY_PAIR, false}});
}

} // namespace cosmic_connect

#include "ConnectCore.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"
#include <algorithm>

namespace cosmic_connect {

namespace {
    std::shared_ptr<CertificateStorage> defaultStorage(const CoreConfig& config) {
        if (config.storageDirectory.empty()) {
            throw ProtocolError(ErrorCode::ConfigError, "No storage directory configured");
        }
        return std::make_shared<FileCertificateStorage>(config.storageDirectory);
    }
}

ConnectCore::ConnectCore(const CoreConfig& config, std::shared_ptr<CertificateStorage> storage)
    : config_(config),
      storage_(storage ? std::move(storage) : defaultStorage(config)),
      certificates_(std::make_shared<CertificateManager>(storage_)),
      trust_store_(std::make_shared<TrustStore>(storage_)),
      pairing_(std::make_shared<PairingManager>(config_, certificates_, trust_store_)),
      registry_(std::make_shared<ConnectionRegistry>()),
      router_(std::make_unique<PluginRouter>(registry_)),
      discovery_(std::make_unique<DiscoveryService>(config_)),
      listener_(config_.minControlPort, config_.maxControlPort, config_.connectionRateLimit) {
    Config::validate(config_);
}

ConnectCore::~ConnectCore() {
    stop();
}

bool ConnectCore::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        return true;
    }

    try {
        NetworkStack::initialize();
        auto certificate = certificates_->getOrCreateLocalCertificate();
        Logger::logEvent(LogLevel::Info, "Local device " + certificate->deviceId + ", fingerprint " +
            CertificateManager::formatFingerprint(certificate->fingerprint));
    }
    catch (const ProtocolError& e) {
        Logger::logError(e.code(), std::string("Cannot load the local identity: ") + e.what());
        return false;
    }

    running_ = true;
    bool listening = listener_.start([this](int socket, const std::string& address) {
        handleIncoming(socket, address);
    });
    if (!listening) {
        running_ = false;
        Logger::logError(ErrorCode::NetworkError, "Cannot open the control listener");
        return false;
    }

    Logger::logEvent(LogLevel::Info, "Core started, control port " + std::to_string(listener_.port()));
    return true;
}

void ConnectCore::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    pairing_->cancelAll();
    listener_.stop();
    discovery_->stop();
    // Attempts accepted while the listener was shutting down
    pairing_->cancelAll();
    reapWorkers(true);

    registry_->closeAll();

    // Replaced sessions may still be finishing their read loops
    std::vector<std::weak_ptr<Session>> started;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        started.swap(started_sessions_);
    }
    for (const auto& entry : started) {
        if (auto session = entry.lock()) {
            session->close();
            session->waitUntilFinished();
        }
    }
    Logger::logEvent(LogLevel::Info, "Core stopped");
    Logger::flush();
}

bool ConnectCore::startDiscovery(DiscoveryCallbacks callbacks) {
    if (!running_) {
        Logger::logError(ErrorCode::InvalidParameter, "Discovery needs a started core");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        discovery_callbacks_ = std::move(callbacks);
    }

    DiscoveryCallbacks wrapped;
    wrapped.onDeviceFound = [this](const DeviceIdentity& identity, const std::string& address) {
        handleDeviceFound(identity, address);
    };
    wrapped.onDeviceLost = [this](const std::string& deviceId) {
        std::function<void(const std::string&)> userCallback;
        {
            std::lock_guard<std::mutex> lock(discovery_mutex_);
            userCallback = discovery_callbacks_.onDeviceLost;
        }
        if (userCallback) {
            userCallback(deviceId);
        }
    };

    try {
        return discovery_->start(localIdentity(), std::move(wrapped));
    }
    catch (const ProtocolError& e) {
        Logger::logError(e.code(), std::string("Cannot start discovery: ") + e.what());
        return false;
    }
}

void ConnectCore::stopDiscovery() {
    discovery_->stop();
}

void ConnectCore::handleDeviceFound(const DeviceIdentity& identity, const std::string& address) {
    std::function<void(const DeviceIdentity&, const std::string&)> userCallback;
    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        userCallback = discovery_callbacks_.onDeviceFound;
    }
    if (userCallback) {
        try {
            userCallback(identity, address);
        }
        catch (const std::exception& e) {
            Logger::logError(ErrorCode::InvalidParameter,
                std::string("Device found callback failed: ") + e.what());
        }
    }

    if (!running_ || !trust_store_->isTrusted(identity.deviceId) || registry_->get(identity.deviceId)) {
        return;
    }
    // Only the side with the smaller id dials, so two peers never race
    if (certificates_->deviceId() >= identity.deviceId) {
        return;
    }

    Logger::logEvent(LogLevel::Info, "Reconnecting to paired device " + identity.deviceId);
    std::string deviceId = identity.deviceId;
    uint16_t port = identity.tcpPort;
    spawnWorker([this, deviceId, address, port]() {
        PairingOutcome outcome = connectTo(address, port, deviceId, false);
        if (!outcome.success()) {
            Logger::logEvent(LogLevel::Warning, "Reconnect to " + deviceId + " failed: " + outcome.message);
        }
    });
}

void ConnectCore::handleIncoming(int socket, const std::string& address) {
    if (!running_) {
        NetworkStack::closeSocket(socket);
        return;
    }
    spawnWorker([this, socket, address]() {
        try {
            startSession(pairing_->handshake(socket, address, localIdentity()));
        }
        catch (const ProtocolError& e) {
            Logger::logError(e.code(), "Connection from " + address + " failed: " + e.what());
        }
    });
}

PairingOutcome ConnectCore::pair(const std::string& deviceId) {
    PairingOutcome outcome;
    if (!IdentityModel::isValidDeviceId(deviceId)) {
        outcome.error = ErrorCode::InvalidParameter;
        outcome.message = "Invalid device id '" + deviceId + "'";
        Logger::logError(outcome.error, outcome.message);
        return outcome;
    }
    if (trust_store_->isTrusted(deviceId) && registry_->get(deviceId)) {
        outcome.state = PairState::Paired;
        return outcome;
    }

    auto device = discovery_->find(deviceId);
    if (!device) {
        outcome.error = ErrorCode::DeviceNotConnected;
        outcome.message = "Device " + deviceId + " has not been discovered";
        Logger::logError(outcome.error, outcome.message);
        return outcome;
    }
    return connectTo(device->address, device->identity.tcpPort, deviceId, true);
}

PairingOutcome ConnectCore::connectTo(const std::string& host, uint16_t port,
    const std::optional<std::string>& expectedDeviceId, bool requestPairing)
{
    PairingOutcome outcome;
    if (!running_) {
        outcome.error = ErrorCode::InvalidParameter;
        outcome.message = "Core is not running";
        return outcome;
    }

    try {
        int socket = NetworkStack::connect(host, port, config_.handshakeTimeout);
        HandshakeOptions options;
        options.expectedDeviceId = expectedDeviceId;
        options.requestPairing = requestPairing;

        startSession(pairing_->handshake(socket, host, localIdentity(), options));
        outcome.state = PairState::Paired;
    }
    catch (const ProtocolError& e) {
        Logger::logError(e.code(), "Connection to " + host + ":" + std::to_string(port) +
            " failed: " + e.what());
        outcome.error = e.code();
        outcome.message = e.what();
        outcome.state = expectedDeviceId && trust_store_->isTrusted(*expectedDeviceId)
            ? PairState::Paired : PairState::Unpaired;
    }
    return outcome;
}

void ConnectCore::startSession(HandshakeResult result) {
    if (!running_) {
        result.transport->close();
        throw ProtocolError(ErrorCode::PairingCancelled, "Core stopped during the handshake");
    }

    auto session = std::make_shared<Session>(result.remoteIdentity, result.transport, result.role,
        result.peerFingerprint, Session::Options{config_.keepaliveInterval, config_.idleTimeout()});

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        started_sessions_.erase(std::remove_if(started_sessions_.begin(), started_sessions_.end(),
            [](const std::weak_ptr<Session>& entry) { return entry.expired(); }),
            started_sessions_.end());
        started_sessions_.push_back(session);
    }

    std::weak_ptr<ConnectionRegistry> registry = registry_;
    registry_->registerSession(session);
    session->start(
        [this](const std::string& deviceId, const Packet& packet) {
            handleSessionPacket(deviceId, packet);
        },
        [registry](const std::shared_ptr<Session>& closed) {
            if (auto current = registry.lock()) {
                current->removeIfCurrent(closed);
            }
        },
        std::move(result.pendingData));
}

void ConnectCore::handleSessionPacket(const std::string& deviceId, const Packet& packet) {
    if (packet.type != protocol::PACKET_TYPE_PAIR) {
        router_->routeInbound(deviceId, packet);
        return;
    }

    if (!packet.getBool("pair")) {
        Logger::logPacket(LogLevel::Security, deviceId, packet.type, "Peer unpaired, forgetting it");
        trust_store_->remove(deviceId);
        registry_->remove(deviceId);
        return;
    }

    // A peer that lost our trust record asks again; it is still trusted here
    if (!packet.getBool("response") && trust_store_->isTrusted(deviceId)) {
        if (auto session = registry_->get(deviceId)) {
            session->send(PairingManager::makePairResponse(true));
        }
        return;
    }
    Logger::logPacket(LogLevel::Debug, deviceId, packet.type, "Ignored outside a handshake");
}

bool ConnectCore::unpair(const std::string& deviceId) {
    if (!IdentityModel::isValidDeviceId(deviceId)) {
        Logger::logError(ErrorCode::InvalidParameter, "Invalid device id '" + deviceId + "'");
        return false;
    }
    if (auto session = registry_->get(deviceId)) {
        try {
            session->send(PairingManager::makeUnpair());
        }
        catch (const ProtocolError& e) {
            Logger::logPacket(LogLevel::Warning, deviceId, protocol::PACKET_TYPE_PAIR,
                std::string("Unpair notice not delivered: ") + e.what());
        }
    }
    pairing_->cancelPairing(deviceId);
    bool removed = trust_store_->remove(deviceId);
    registry_->remove(deviceId);
    if (removed) {
        Logger::logEvent(LogLevel::Security, "Unpaired " + deviceId);
    }
    return removed;
}

void ConnectCore::send(const std::string& deviceId, const Packet& packet) {
    router_->send(deviceId, packet);
}

void ConnectCore::registerHandler(const std::string& prefix, std::shared_ptr<PacketHandler> handler) {
    router_->registerHandler(prefix, std::move(handler));
    announceIdentityChange();
}

void ConnectCore::announceIdentityChange() {
    if (!discovery_->isRunning()) {
        return;
    }
    try {
        discovery_->setLocalIdentity(localIdentity());
        discovery_->announceNow();
    }
    catch (const ProtocolError& e) {
        Logger::logError(e.code(), std::string("Cannot update the announced identity: ") + e.what());
    }
}

void ConnectCore::setPairRequestHandler(PairingManager::PairRequestHandler handler) {
    pairing_->setPairRequestHandler(std::move(handler));
}

bool ConnectCore::acceptPairing(const std::string& deviceId) {
    return pairing_->acceptPairing(deviceId);
}

bool ConnectCore::rejectPairing(const std::string& deviceId) {
    return pairing_->rejectPairing(deviceId);
}

bool ConnectCore::cancelPairing(const std::string& deviceId) {
    return pairing_->cancelPairing(deviceId);
}

PairState ConnectCore::pairState(const std::string& deviceId) {
    return pairing_->pairState(deviceId);
}

std::vector<std::string> ConnectCore::connectedDevices() const {
    return registry_->listConnected();
}

std::vector<TrustedPeer> ConnectCore::trustedPeers() {
    return trust_store_->list();
}

std::vector<DiscoveredDevice> ConnectCore::discoveredDevices() const {
    return discovery_->devices();
}

DeviceIdentity ConnectCore::localIdentity() const {
    return IdentityModel::buildLocalIdentity(config_, certificates_->deviceId(), listener_.port(),
        router_->incomingCapabilities(), router_->outgoingCapabilities());
}

std::string ConnectCore::localFingerprint() const {
    return certificates_->getOrCreateLocalCertificate()->fingerprint;
}

void ConnectCore::spawnWorker(std::function<void()> task) {
    reapWorkers(false);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([task = std::move(task), done]() {
        try {
            task();
        }
        catch (const std::exception& e) {
            Logger::logError(ErrorCode::NetworkError, std::string("Connection worker failed: ") + e.what());
        }
        done->store(true);
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(Worker{std::move(thread), done});
}

void ConnectCore::reapWorkers(bool all) {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

} // namespace cosmic_connect

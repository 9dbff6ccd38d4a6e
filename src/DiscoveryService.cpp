#include "DiscoveryService.hpp"
#include "Logger.hpp"
#include "NetworkStack.hpp"
#include "PacketCodec.hpp"
#include <sys/socket.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <unistd.h>
#include <poll.h>
#include <errno.h>
#include <string.h>
#include <algorithm>

namespace cosmic_connect {

const char* toString(DiscoveryService::State state) {
    switch (state) {
        case DiscoveryService::State::Idle: return "idle";
        case DiscoveryService::State::Broadcasting: return "broadcasting";
        case DiscoveryService::State::Stopped: return "stopped";
    }
    return "unknown";
}

DeviceCache::DeviceCache(std::string localDeviceId,
    std::chrono::milliseconds expiry,
    uint16_t minPort,
    uint16_t maxPort,
    DiscoveryCallbacks callbacks)
    : local_device_id_(std::move(localDeviceId)),
      expiry_(expiry),
      min_port_(minPort),
      max_port_(maxPort),
      callbacks_(std::move(callbacks)) {
}

bool DeviceCache::handleDatagram(std::string_view data, const std::string& source, Clock::time_point now) {
    DeviceIdentity identity;
    try {
        identity = IdentityModel::fromPacket(PacketCodec::decode(data));
    }
    catch (const ProtocolError& e) {
        Logger::logEvent(LogLevel::Debug, "Ignoring datagram from " + source + ": " + e.what());
        return false;
    }

    if (identity.deviceId == local_device_id_) {
        return false;
    }
    if (identity.tcpPort < min_port_ || identity.tcpPort > max_port_) {
        Logger::logEvent(LogLevel::Debug, "Ignoring " + identity.deviceId + " from " + source +
            ": control port " + std::to_string(identity.tcpPort) + " outside the allowed range");
        return false;
    }
    // Targeted identities belong on a control connection, not here
    identity.targetDeviceId.reset();
    identity.targetProtocolVersion.reset();

    bool isNew = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(identity.deviceId);
        if (it == devices_.end()) {
            devices_.emplace(identity.deviceId, DiscoveredDevice{identity, source, now});
            isNew = true;
        } else {
            it->second.identity = identity;
            it->second.address = source;
            it->second.lastSeen = now;
        }
    }

    if (isNew) {
        Logger::logEvent(LogLevel::Info, "Discovered " + identity.deviceId + " (" +
            identity.deviceName + ") at " + source);
        if (callbacks_.onDeviceFound) {
            try {
                callbacks_.onDeviceFound(identity, source);
            }
            catch (const std::exception& e) {
                Logger::logError(ErrorCode::InvalidParameter,
                    "Device found callback failed for " + identity.deviceId + ": " + e.what());
            }
        }
    }
    return true;
}

std::vector<std::string> DeviceCache::sweepExpired(Clock::time_point now) {
    std::vector<std::string> lost;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = devices_.begin(); it != devices_.end();) {
            if (now - it->second.lastSeen > expiry_) {
                lost.push_back(it->first);
                it = devices_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& deviceId : lost) {
        Logger::logEvent(LogLevel::Info, "Lost " + deviceId);
        if (callbacks_.onDeviceLost) {
            // Every expired device is reported even if an earlier callback fails
            try {
                callbacks_.onDeviceLost(deviceId);
            }
            catch (const std::exception& e) {
                Logger::logError(ErrorCode::InvalidParameter,
                    "Device lost callback failed for " + deviceId + ": " + e.what());
            }
        }
    }
    return lost;
}

std::vector<DiscoveredDevice> DeviceCache::devices() const {
    std::vector<DiscoveredDevice> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(devices_.size());
        for (const auto& [deviceId, device] : devices_) {
            result.push_back(device);
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.identity.deviceId < b.identity.deviceId;
    });
    return result;
}

std::optional<DiscoveredDevice> DeviceCache::find(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(deviceId);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

DiscoveryService::DiscoveryService(const CoreConfig& config)
    : config_(config) {
}

DiscoveryService::~DiscoveryService() {
    stop();
}

bool DiscoveryService::start(const DeviceIdentity& localIdentity, DiscoveryCallbacks callbacks) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (state_ == State::Broadcasting) {
        Logger::logEvent(LogLevel::Warning, "Discovery is already running");
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        local_identity_ = localIdentity;
    }
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_ = std::make_shared<DeviceCache>(localIdentity.deviceId,
            config_.discoveryExpiry(), config_.minControlPort, config_.maxControlPort,
            std::move(callbacks));
    }

    sockets_ = openSockets();
    if (sockets_.empty()) {
        Logger::logError(ErrorCode::NetworkError, "No interface available for discovery");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        announce_requested_ = false;
        state_ = State::Broadcasting;
    }

    for (const auto& entry : sockets_) {
        listener_threads_.emplace_back(&DiscoveryService::listenLoop, this, entry);
    }
    announce_thread_ = std::thread(&DiscoveryService::announceLoop, this);

    Logger::logEvent(LogLevel::Info, "Discovery started on " + std::to_string(sockets_.size()) +
        " interface(s), group " + config_.multicastGroup + ":" + std::to_string(config_.discoveryPort));
    return true;
}

void DiscoveryService::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (state_ != State::Broadcasting) {
            return;
        }
        state_ = State::Stopped;
    }
    wake_cv_.notify_all();

    if (announce_thread_.joinable()) {
        announce_thread_.join();
    }
    for (auto& thread : listener_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    listener_threads_.clear();

    closeSockets();
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_.reset();
    }
    Logger::logEvent(LogLevel::Info, "Discovery stopped");
}

std::shared_ptr<DeviceCache> DiscoveryService::cache() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_;
}

std::vector<DiscoveredDevice> DiscoveryService::devices() const {
    auto current = cache();
    return current ? current->devices() : std::vector<DiscoveredDevice>{};
}

std::optional<DiscoveredDevice> DiscoveryService::find(const std::string& deviceId) const {
    auto current = cache();
    return current ? current->find(deviceId) : std::nullopt;
}

void DiscoveryService::setLocalIdentity(const DeviceIdentity& identity) {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    local_identity_ = identity;
}

void DiscoveryService::announceNow() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        announce_requested_ = true;
    }
    wake_cv_.notify_all();
}

std::vector<DiscoveryService::InterfaceSocket> DiscoveryService::openSockets() {
    in_addr group{};
    if (inet_pton(AF_INET, config_.multicastGroup.c_str(), &group) != 1) {
        Logger::logError(ErrorCode::ConfigError, "Invalid multicast group " + config_.multicastGroup);
        return {};
    }

    std::vector<InterfaceSocket> candidates;
    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) == 0) {
        for (ifaddrs* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
            if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_MULTICAST)) {
                continue;
            }
            InterfaceSocket entry;
            entry.name = ifa->ifa_name;
            entry.address = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr)->sin_addr;
            bool duplicate = std::any_of(candidates.begin(), candidates.end(),
                [&entry](const InterfaceSocket& other) {
                    return other.address.s_addr == entry.address.s_addr;
                });
            if (!duplicate) {
                candidates.push_back(entry);
            }
        }
        freeifaddrs(interfaces);
    } else {
        Logger::logEvent(LogLevel::Warning, std::string("Cannot list interfaces: ") + strerror(errno));
    }

    // Let the kernel pick the route when nothing usable was listed
    if (candidates.empty()) {
        InterfaceSocket fallback;
        fallback.name = "default";
        fallback.address.s_addr = htonl(INADDR_ANY);
        candidates.push_back(fallback);
    }

    std::vector<InterfaceSocket> opened;
    for (auto& entry : candidates) {
        if (openSocket(entry, group)) {
            opened.push_back(entry);
        }
    }
    return opened;
}

bool DiscoveryService::openSocket(InterfaceSocket& entry, const in_addr& group) {
    auto fail = [&entry](const std::string& step, int fd) {
        Logger::logEvent(LogLevel::Warning, "Discovery on " + entry.name + " disabled, " +
            step + " failed: " + strerror(errno));
        if (fd >= 0) {
            close(fd);
        }
        return false;
    };

    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return fail("socket", fd);
    }

    int enable = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        return fail("SO_REUSEADDR", fd);
    }
#ifdef SO_REUSEPORT
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable)) < 0) {
        return fail("SO_REUSEPORT", fd);
    }
#endif
#ifdef IP_MULTICAST_ALL
    // Only receive the memberships joined on this socket's interface
    int disable = 0;
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_ALL, &disable, sizeof(disable)) < 0) {
        return fail("IP_MULTICAST_ALL", fd);
    }
#endif

    sockaddr_in bindAddress{};
    bindAddress.sin_family = AF_INET;
    bindAddress.sin_addr.s_addr = htonl(INADDR_ANY);
    bindAddress.sin_port = htons(config_.discoveryPort);
    if (bind(fd, reinterpret_cast<sockaddr*>(&bindAddress), sizeof(bindAddress)) < 0) {
        return fail("bind", fd);
    }

    ip_mreq membership{};
    membership.imr_multiaddr = group;
    membership.imr_interface = entry.address;
    if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) < 0) {
        return fail("IP_ADD_MEMBERSHIP", fd);
    }
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &entry.address, sizeof(entry.address)) < 0) {
        return fail("IP_MULTICAST_IF", fd);
    }

    unsigned char ttl = protocol::MULTICAST_TTL;
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        return fail("IP_MULTICAST_TTL", fd);
    }
    // Other instances on this host must hear us too
    unsigned char loop = 1;
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) {
        return fail("IP_MULTICAST_LOOP", fd);
    }

    entry.fd = fd;
    char text[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &entry.address, text, sizeof(text));
    Logger::logEvent(LogLevel::Debug, "Discovery socket ready on " + entry.name + " (" + text + ")");
    return true;
}

void DiscoveryService::closeSockets() {
    in_addr group{};
    bool haveGroup = inet_pton(AF_INET, config_.multicastGroup.c_str(), &group) == 1;

    for (auto& entry : sockets_) {
        if (entry.fd < 0) {
            continue;
        }
        if (haveGroup) {
            ip_mreq membership{};
            membership.imr_multiaddr = group;
            membership.imr_interface = entry.address;
            if (setsockopt(entry.fd, IPPROTO_IP, IP_DROP_MEMBERSHIP, &membership, sizeof(membership)) < 0) {
                Logger::logEvent(LogLevel::Debug, "Leaving group on " + entry.name + " failed: " +
                    strerror(errno));
            }
        }
        close(entry.fd);
        entry.fd = -1;
    }
    sockets_.clear();
}

void DiscoveryService::listenLoop(const InterfaceSocket& entry) {
    std::vector<char> buffer(protocol::MAX_DATAGRAM_SIZE);
    pollfd pfd{};
    pfd.fd = entry.fd;
    pfd.events = POLLIN;

    while (isRunning()) {
        int ready = poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::logError(ErrorCode::NetworkError, "Discovery poll on " + entry.name +
                " failed: " + strerror(errno));
            break;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        sockaddr_in source{};
        socklen_t sourceLength = sizeof(source);
        ssize_t received = recvfrom(entry.fd, buffer.data(), buffer.size(), 0,
            reinterpret_cast<sockaddr*>(&source), &sourceLength);
        if (received < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                Logger::logEvent(LogLevel::Warning, "Discovery receive on " + entry.name +
                    " failed: " + strerror(errno));
            }
            continue;
        }

        auto current = cache();
        if (!current) {
            continue;
        }
        try {
            current->handleDatagram(std::string_view(buffer.data(), static_cast<size_t>(received)),
                NetworkStack::addressToString(reinterpret_cast<sockaddr*>(&source)),
                DeviceCache::Clock::now());
        }
        catch (const std::exception& e) {
            Logger::logError(ErrorCode::InvalidParameter,
                std::string("Discovery callback failed: ") + e.what());
        }
    }
}

void DiscoveryService::announceLoop() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (state_ == State::Broadcasting) {
        lock.unlock();
        announce();
        if (auto current = cache()) {
            try {
                current->sweepExpired(DeviceCache::Clock::now());
            }
            catch (const std::exception& e) {
                Logger::logError(ErrorCode::InvalidParameter,
                    std::string("Discovery callback failed: ") + e.what());
            }
        }
        lock.lock();

        wake_cv_.wait_for(lock, config_.broadcastInterval, [this] {
            return announce_requested_ || state_ != State::Broadcasting;
        });
        announce_requested_ = false;
    }
}

void DiscoveryService::announce() {
    std::string datagram;
    {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        datagram = PacketCodec::encode(IdentityModel::toPacket(local_identity_));
    }
    if (datagram.size() > protocol::MAX_DATAGRAM_SIZE) {
        Logger::logError(ErrorCode::InvalidParameter, "Identity does not fit in one datagram");
        return;
    }

    sockaddr_in destination{};
    destination.sin_family = AF_INET;
    destination.sin_port = htons(config_.discoveryPort);
    if (inet_pton(AF_INET, config_.multicastGroup.c_str(), &destination.sin_addr) != 1) {
        return;
    }

    for (const auto& entry : sockets_) {
        ssize_t sent = sendto(entry.fd, datagram.data(), datagram.size(), 0,
            reinterpret_cast<const sockaddr*>(&destination), sizeof(destination));
        if (sent < 0) {
            Logger::logEvent(LogLevel::Debug, "Announcement on " + entry.name + " failed: " +
                strerror(errno));
        }
    }
}

} // namespace cosmic_connect

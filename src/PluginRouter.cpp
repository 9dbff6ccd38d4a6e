#include "PluginRouter.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace cosmic_connect {

PluginRouter::PluginRouter(std::shared_ptr<ConnectionRegistry> registry)
    : registry_(std::move(registry)), observer_id_(0) {
    if (!registry_) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Router needs a connection registry");
    }
    observer_id_ = registry_->addObserver(
        [this](ConnectionRegistry::Event event, const std::string& deviceId) {
            fanOut(event, deviceId);
        });
}

PluginRouter::~PluginRouter() {
    registry_->removeObserver(observer_id_);
}

bool PluginRouter::matchesPrefix(const std::string& packetType, const std::string& prefix) {
    if (packetType.size() < prefix.size() || packetType.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return packetType.size() == prefix.size() || packetType[prefix.size()] == '.';
}

void PluginRouter::registerHandler(const std::string& prefix, std::shared_ptr<PacketHandler> handler) {
    if (!handler) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Handler for " + prefix + " is null");
    }
    if (prefix.empty() || prefix.front() == '.' || prefix.back() == '.' ||
        prefix.find("..") != std::string::npos) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Invalid capability prefix '" + prefix + "'");
    }

    std::unique_lock<std::shared_mutex> lock(handlers_mutex_);
    auto taken = std::find_if(handlers_.begin(), handlers_.end(),
        [&prefix](const Registration& entry) { return entry.prefix == prefix; });
    if (taken != handlers_.end()) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Prefix " + prefix + " is already registered");
    }
    handlers_.push_back(Registration{prefix, std::move(handler)});

    Logger::logEvent(LogLevel::Debug, "Registered handler for " + prefix);
}

bool PluginRouter::routeInbound(const std::string& deviceId, const Packet& packet) {
    std::shared_ptr<PacketHandler> target;
    {
        std::shared_lock<std::shared_mutex> lock(handlers_mutex_);
        size_t bestLength = 0;
        for (const auto& entry : handlers_) {
            if (entry.prefix.size() > bestLength && matchesPrefix(packet.type, entry.prefix)) {
                bestLength = entry.prefix.size();
                target = entry.handler;
            }
        }
    }

    if (!target) {
        Logger::logPacket(LogLevel::Warning, deviceId, packet.type, "No handler, dropping packet");
        return false;
    }

    try {
        target->handlePacket(deviceId, packet);
    }
    catch (const std::exception& e) {
        Logger::logPacket(LogLevel::Error, deviceId, packet.type,
            std::string("Handler failed: ") + e.what());
    }
    return true;
}

void PluginRouter::send(const std::string& deviceId, const Packet& packet) {
    auto session = registry_->get(deviceId);
    if (!session || !session->isOpen()) {
        throw ProtocolError(ErrorCode::DeviceNotConnected, "Device " + deviceId + " is not connected");
    }
    session->send(packet);
    Logger::logPacket(LogLevel::Debug, deviceId, packet.type, "Sent");
}

std::vector<PluginRouter::Registration> PluginRouter::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(handlers_mutex_);
    return handlers_;
}

void PluginRouter::fanOut(ConnectionRegistry::Event event, const std::string& deviceId) {
    for (const auto& entry : snapshot()) {
        try {
            if (event == ConnectionRegistry::Event::Connected) {
                entry.handler->onConnected(deviceId);
            } else {
                entry.handler->onDisconnected(deviceId);
            }
        }
        catch (const std::exception& e) {
            Logger::logError(ErrorCode::InvalidParameter, "Handler " + entry.prefix +
                " failed on " + toString(event) + " of " + deviceId + ": " + e.what());
        }
    }
}

std::vector<std::string> PluginRouter::incomingCapabilities() const {
    std::vector<std::string> result;
    for (const auto& entry : snapshot()) {
        auto declared = entry.handler->incomingCapabilities();
        if (declared.empty()) {
            result.push_back(entry.prefix);
        } else {
            result.insert(result.end(), declared.begin(), declared.end());
        }
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::vector<std::string> PluginRouter::outgoingCapabilities() const {
    std::vector<std::string> result;
    for (const auto& entry : snapshot()) {
        auto declared = entry.handler->outgoingCapabilities();
        result.insert(result.end(), declared.begin(), declared.end());
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::vector<std::string> PluginRouter::registeredPrefixes() const {
    std::vector<std::string> prefixes;
    for (const auto& entry : snapshot()) {
        prefixes.push_back(entry.prefix);
    }
    return prefixes;
}

} // namespace cosmic_connect

#include "ConnectionRegistry.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace cosmic_connect {

const char* toString(ConnectionRegistry::Event event) {
    return event == ConnectionRegistry::Event::Connected ? "connected" : "disconnected";
}

ConnectionRegistry::~ConnectionRegistry() {
    closeAll();
}

size_t ConnectionRegistry::addObserver(Observer observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    size_t id = next_observer_id_++;
    observers_.emplace_back(id, std::move(observer));
    return id;
}

void ConnectionRegistry::removeObserver(size_t id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
        [id](const auto& entry) { return entry.first == id; }), observers_.end());
}

void ConnectionRegistry::registerSession(std::shared_ptr<Session> session) {
    if (!session) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Cannot register an empty session");
    }
    const std::string deviceId = session->deviceId();

    std::shared_ptr<Session> previous;
    {
        auto deviceLock = device_locks_.get(deviceId);
        std::lock_guard<std::mutex> lock(*deviceLock);
        {
            std::lock_guard<std::mutex> mapLock(sessions_mutex_);
            auto& slot = sessions_[deviceId];
            previous = std::move(slot);
            slot = session;
        }
        if (previous && previous != session) {
            Logger::logEvent(LogLevel::Info, "Replacing existing session with " + deviceId);
            previous->close();
        }
    }

    // Observers run unlocked so they may call back into the registry
    if (previous && previous != session) {
        notify(Event::Disconnected, deviceId);
    }
    if (previous != session) {
        notify(Event::Connected, deviceId);
    }
}

std::shared_ptr<Session> ConnectionRegistry::get(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(deviceId);
    return it == sessions_.end() ? nullptr : it->second;
}

bool ConnectionRegistry::remove(const std::string& deviceId) {
    std::shared_ptr<Session> removed;
    {
        auto deviceLock = device_locks_.get(deviceId);
        std::lock_guard<std::mutex> lock(*deviceLock);
        {
            std::lock_guard<std::mutex> mapLock(sessions_mutex_);
            auto it = sessions_.find(deviceId);
            if (it == sessions_.end()) {
                return false;
            }
            removed = std::move(it->second);
            sessions_.erase(it);
        }
        removed->close();
    }

    notify(Event::Disconnected, deviceId);
    return true;
}

bool ConnectionRegistry::removeIfCurrent(const std::shared_ptr<Session>& session) {
    if (!session) {
        return false;
    }
    const std::string deviceId = session->deviceId();
    {
        auto deviceLock = device_locks_.get(deviceId);
        std::lock_guard<std::mutex> lock(*deviceLock);
        {
            std::lock_guard<std::mutex> mapLock(sessions_mutex_);
            auto it = sessions_.find(deviceId);
            if (it == sessions_.end() || it->second != session) {
                return false;
            }
            sessions_.erase(it);
        }
        session->close();
    }

    notify(Event::Disconnected, deviceId);
    return true;
}

std::vector<std::string> ConnectionRegistry::listConnected() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        ids.reserve(sessions_.size());
        for (const auto& [deviceId, session] : sessions_) {
            ids.push_back(deviceId);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::shared_ptr<Session>> ConnectionRegistry::closeAll() {
    std::vector<std::shared_ptr<Session>> closed;
    for (const auto& deviceId : listConnected()) {
        std::shared_ptr<Session> session;
        {
            auto deviceLock = device_locks_.get(deviceId);
            std::lock_guard<std::mutex> lock(*deviceLock);
            {
                std::lock_guard<std::mutex> mapLock(sessions_mutex_);
                auto it = sessions_.find(deviceId);
                if (it == sessions_.end()) {
                    continue;
                }
                session = std::move(it->second);
                sessions_.erase(it);
            }
            session->close();
        }
        notify(Event::Disconnected, deviceId);
        closed.push_back(std::move(session));
    }
    return closed;
}

void ConnectionRegistry::notify(Event event, const std::string& deviceId) {
    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }

    Logger::logEvent(LogLevel::Info, std::string("Device ") + deviceId + " " + toString(event));

    for (const auto& observer : observers) {
        try {
            observer(event, deviceId);
        }
        catch (const std::exception& e) {
            Logger::logError(ErrorCode::InvalidParameter,
                "Connection observer failed for " + deviceId + ": " + e.what());
        }
    }
}

} // namespace cosmic_connect

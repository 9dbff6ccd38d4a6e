#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Session.hpp"
#include "Utils.hpp"

namespace cosmic_connect {

// At most one live Session per device id. Work on one device is serialized;
// different devices never wait for each other.
class ConnectionRegistry {
public:
    enum class Event {
        Connected,
        Disconnected
    };

    using Observer = std::function<void(Event event, const std::string& deviceId)>;

    ConnectionRegistry() = default;
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Observers run in registration order on the thread that caused the
    // event, with no registry lock held; one failing observer does not keep
    // the others from running
    size_t addObserver(Observer observer);
    void removeObserver(size_t id);

    // Replaces and closes a previous session of the same device. Emits
    // Disconnected for the old session before Connected for the new one.
    void registerSession(std::shared_ptr<Session> session);

    std::shared_ptr<Session> get(const std::string& deviceId) const;

    // Closes the device's session; false when none was registered
    bool remove(const std::string& deviceId);

    // Removes the session only while it is still the registered one
    bool removeIfCurrent(const std::shared_ptr<Session>& session);

    std::vector<std::string> listConnected() const;

    // Closes every session and returns them so callers can wait for their
    // read loops
    std::vector<std::shared_ptr<Session>> closeAll();

private:
    void notify(Event event, const std::string& deviceId);

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    KeyedMutex device_locks_;

    std::mutex observers_mutex_;
    std::vector<std::pair<size_t, Observer>> observers_;
    size_t next_observer_id_ = 1;
};

const char* toString(ConnectionRegistry::Event event);

} // namespace cosmic_connect

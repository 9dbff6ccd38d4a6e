#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "CoreTypes.hpp"
#include "DeviceIdentity.hpp"
#include "Packet.hpp"
#include "Transport.hpp"

namespace cosmic_connect {

// One live authenticated connection to a paired device. Owned by the
// ConnectionRegistry; other components only send through it.
class Session : public std::enable_shared_from_this<Session> {
public:
    using PacketCallback = std::function<void(const std::string& deviceId, const Packet& packet)>;
    using ClosedCallback = std::function<void(const std::shared_ptr<Session>& session)>;

    struct Options {
        std::chrono::milliseconds keepaliveInterval;
        std::chrono::milliseconds idleTimeout;
    };

    Session(DeviceIdentity remoteIdentity,
        std::shared_ptr<Transport> transport,
        TlsRole role,
        std::string peerFingerprint,
        Options options);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Starts the read loop. pendingData holds bytes already read from the
    // transport during the handshake.
    void start(PacketCallback onPacket, ClosedCallback onClosed, std::string pendingData = "");

    // Whole packets in call order. Throws ProtocolError(DeviceNotConnected)
    // once closed, ProtocolError(NetworkError) when the write fails.
    void send(const Packet& packet);

    // Idempotent and safe from any thread, the read loop included
    void close();

    // Returns once the read loop has finished its callbacks
    void waitUntilFinished();

    bool isOpen() const { return open_.load(); }
    const std::string& deviceId() const { return remote_identity_.deviceId; }
    const DeviceIdentity& remoteIdentity() const { return remote_identity_; }
    TlsRole role() const { return role_; }
    const std::string& peerFingerprint() const { return peer_fingerprint_; }

private:
    void readLoop(std::string pendingData);
    void dispatch(const Packet& packet);
    void sendKeepalive();

    DeviceIdentity remote_identity_;
    std::shared_ptr<Transport> transport_;
    TlsRole role_;
    std::string peer_fingerprint_;
    Options options_;

    PacketCallback on_packet_;
    ClosedCallback on_closed_;

    std::atomic<bool> open_{true};
    std::atomic<bool> started_{false};
    std::mutex send_mutex_;

    std::mutex finished_mutex_;
    std::condition_variable finished_cv_;
    bool finished_ = false;
};

} // namespace cosmic_connect

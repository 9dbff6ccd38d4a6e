#include "Session.hpp"
#include "Logger.hpp"
#include "PacketCodec.hpp"
#include "Protocol.hpp"
#include <algorithm>

namespace cosmic_connect {

Session::Session(DeviceIdentity remoteIdentity,
    std::shared_ptr<Transport> transport,
    TlsRole role,
    std::string peerFingerprint,
    Options options)
    : remote_identity_(std::move(remoteIdentity)),
      transport_(std::move(transport)),
      role_(role),
      peer_fingerprint_(std::move(peerFingerprint)),
      options_(options) {
    if (!transport_) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Session needs a transport");
    }
}

Session::~Session() {
    close();
}

void Session::start(PacketCallback onPacket, ClosedCallback onClosed, std::string pendingData) {
    if (started_.exchange(true)) {
        throw ProtocolError(ErrorCode::InvalidParameter,
            "Session with " + deviceId() + " already started");
    }
    on_packet_ = std::move(onPacket);
    on_closed_ = std::move(onClosed);

    // The thread keeps the session alive until the read loop is done
    auto self = shared_from_this();
    std::thread reader([self, data = std::move(pendingData)]() mutable {
        self->readLoop(std::move(data));
    });
    reader.detach();
}

void Session::send(const Packet& packet) {
    if (!open_) {
        throw ProtocolError(ErrorCode::DeviceNotConnected,
            "Session with " + deviceId() + " is closed");
    }

    std::string frame = PacketCodec::encode(packet);

    std::lock_guard<std::mutex> lock(send_mutex_);
    try {
        transport_->write(frame);
    }
    catch (const ProtocolError& e) {
        Logger::logPacket(LogLevel::Warning, deviceId(), packet.type,
            std::string("Send failed, closing session: ") + e.what());
        close();
        throw;
    }
}

void Session::close() {
    if (open_.exchange(false)) {
        Logger::logEvent(LogLevel::Info, "Closing session with " + deviceId());
    }
    transport_->close();
}

void Session::waitUntilFinished() {
    if (!started_) {
        return;
    }
    std::unique_lock<std::mutex> lock(finished_mutex_);
    finished_cv_.wait(lock, [this] { return finished_; });
}

void Session::readLoop(std::string pendingData) {
    PacketReader reader;
    reader.feed(pendingData);

    auto now = std::chrono::steady_clock::now();
    auto lastInbound = now;
    auto lastKeepalive = now;
    auto readTimeout = std::max<std::chrono::milliseconds>(
        std::chrono::milliseconds(1), options_.keepaliveInterval / 2);

    while (open_) {
        // Drain every complete frame before reading more
        try {
            while (auto packet = reader.next()) {
                dispatch(*packet);
            }
        }
        catch (const ProtocolError& e) {
            Logger::logPacket(LogLevel::Warning, deviceId(), "",
                std::string("Dropped frame: ") + e.what());
            continue;
        }

        auto received = transport_->read(readTimeout);
        now = std::chrono::steady_clock::now();

        if (received.status == Transport::ReadStatus::Closed) {
            break;
        }
        if (received.status == Transport::ReadStatus::Data) {
            lastInbound = now;
            reader.feed(received.data);
        }

        if (now - lastInbound >= options_.idleTimeout) {
            Logger::logEvent(LogLevel::Warning, "No traffic from " + deviceId() +
                " within the idle limit, closing session");
            break;
        }
        if (now - lastKeepalive >= options_.keepaliveInterval) {
            lastKeepalive = now;
            sendKeepalive();
        }
    }

    close();

    if (on_closed_) {
        try {
            on_closed_(shared_from_this());
        }
        catch (const std::exception& e) {
            Logger::logError(ErrorCode::NetworkError,
                "Close handler for " + deviceId() + " failed: " + e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(finished_mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

void Session::dispatch(const Packet& packet) {
    if (packet.type == protocol::PACKET_TYPE_KEEPALIVE) {
        return;
    }
    if (!on_packet_) {
        return;
    }
    try {
        on_packet_(deviceId(), packet);
    }
    catch (const std::exception& e) {
        Logger::logPacket(LogLevel::Error, deviceId(), packet.type,
            std::string("Packet handler failed: ") + e.what());
    }
}

void Session::sendKeepalive() {
    try {
        send(Packet::create(protocol::PACKET_TYPE_KEEPALIVE));
    }
    catch (const ProtocolError& e) {
        Logger::logPacket(LogLevel::Debug, deviceId(), protocol::PACKET_TYPE_KEEPALIVE,
            std::string("Keepalive failed: ") + e.what());
    }
}

} // namespace cosmic_connect

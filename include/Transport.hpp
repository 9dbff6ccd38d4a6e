#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace cosmic_connect {

// Reliable byte stream under a Session. close() may be called from any
// thread and wakes a blocked read().
class Transport {
public:
    enum class ReadStatus {
        Data,
        Timeout,
        Closed
    };

    struct ReadResult {
        ReadStatus status = ReadStatus::Closed;
        std::string data;
    };

    virtual ~Transport() = default;

    // Writes all bytes or throws ProtocolError(NetworkError)
    virtual void write(std::string_view data) = 0;
    virtual ReadResult read(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual std::string peerAddress() const = 0;
};

// Connected pair of in-process transports
class MemoryTransport : public Transport {
    struct ConstructionKey {};
    struct Channel {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::string> chunks;
        bool closed = false;
    };

public:
    static std::pair<std::shared_ptr<MemoryTransport>, std::shared_ptr<MemoryTransport>> createPair();

    MemoryTransport(ConstructionKey, std::shared_ptr<Channel> inbound, std::shared_ptr<Channel> outbound);

    void write(std::string_view data) override;
    ReadResult read(std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override;
    std::string peerAddress() const override { return "memory"; }

private:
    std::shared_ptr<Channel> inbound_;
    std::shared_ptr<Channel> outbound_;
};

} // namespace cosmic_connect

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include "Utils.hpp"

struct sockaddr;

namespace cosmic_connect {

// Plain TCP socket helpers used before a connection is upgraded to TLS.
// Functions that fail throw ProtocolError(NetworkError).
class NetworkStack {
public:
    static void initialize();

    // Blocking connect bounded by timeout; returns the connected socket
    static int connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    static void sendAll(int socket, std::string_view data, std::chrono::milliseconds timeout);

    // Reads exactly one '\n' terminated line without consuming the bytes that
    // follow it. Returns nullopt when the peer closed before a full line.
    static std::optional<std::string> readLine(int socket, size_t maxSize,
        std::chrono::milliseconds timeout);

    static bool setSocketOptions(int socket);
    static bool setNonBlocking(int socket, bool enable);
    static std::string addressToString(const struct sockaddr* address);

    // Wakes any thread blocked on the socket without releasing the descriptor
    static void shutdownSocket(int socket);
    static void closeSocket(int socket);

private:
    static constexpr int KEEPALIVE_IDLE_SECONDS = 10;
    static constexpr int KEEPALIVE_PROBE_INTERVAL_SECONDS = 5;
    static constexpr int KEEPALIVE_PROBE_COUNT = 3;
    static constexpr size_t PEEK_SIZE = 4096;

    // Prevent instantiation
    NetworkStack() = delete;
    ~NetworkStack() = delete;
    NetworkStack(const NetworkStack&) = delete;
    NetworkStack& operator=(const NetworkStack&) = delete;
};

// Accepts control connections on the first free port of a range
class ControlListener {
public:
    // Receives ownership of the accepted socket
    using ConnectionHandler = std::function<void(int socket, const std::string& address)>;

    ControlListener(uint16_t minPort, uint16_t maxPort, std::chrono::milliseconds rateLimit);
    ~ControlListener();

    ControlListener(const ControlListener&) = delete;
    ControlListener& operator=(const ControlListener&) = delete;

    bool start(ConnectionHandler handler);
    void stop();

    bool isRunning() const { return running_.load(); }
    uint16_t port() const { return port_.load(); }

private:
    static constexpr int POLL_TIMEOUT_MS = 500;
    static constexpr int BACKLOG = 16;

    void acceptLoop();

    uint16_t min_port_;
    uint16_t max_port_;
    RateLimiter rate_limiter_;
    ConnectionHandler handler_;

    std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::atomic<int> listen_socket_{-1};
    std::atomic<uint16_t> port_{0};
    std::thread accept_thread_;
};

} // namespace cosmic_connect

#include "NetworkStack.hpp"
#include "CoreTypes.hpp"
#include "Logger.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <signal.h>
#include <string.h>
#include <openssl/ssl.h>

namespace cosmic_connect {

namespace {
    [[noreturn]] void networkError(const std::string& message) {
        throw ProtocolError(ErrorCode::NetworkError, message);
    }

    int remainingMs(std::chrono::steady_clock::time_point deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    }

    // Waits for the requested events until the deadline; false on timeout
    bool waitFor(int socket, short events, std::chrono::steady_clock::time_point deadline) {
        while (true) {
            pollfd pfd{socket, events, 0};
            int result = poll(&pfd, 1, remainingMs(deadline));
            if (result < 0) {
                if (errno == EINTR) continue;
                networkError("Poll failed: " + std::string(strerror(errno)));
            }
            if (result == 0) {
                return false;
            }
            return true;
        }
    }
}

void NetworkStack::initialize() {
    // Peers closing mid-write must surface as EPIPE, not kill the process
    signal(SIGPIPE, SIG_IGN);
    OPENSSL_init_ssl(0, nullptr);
}

bool NetworkStack::setSocketOptions(int socket) {
    if (socket < 0) return false;

    // Enable TCP keepalive
    int keepalive = 1;
    if (setsockopt(socket, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive)) < 0) {
        return false;
    }

    int idle = KEEPALIVE_IDLE_SECONDS;
    int interval = KEEPALIVE_PROBE_INTERVAL_SECONDS;
    int count = KEEPALIVE_PROBE_COUNT;
    if (setsockopt(socket, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) < 0 ||
        setsockopt(socket, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval)) < 0 ||
        setsockopt(socket, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count)) < 0) {
        return false;
    }

    int nodelay = 1;
    if (setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) < 0) {
        return false;
    }

    return true;
}

bool NetworkStack::setNonBlocking(int socket, bool enable) {
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(socket, F_SETFL, flags) == 0;
}

std::string NetworkStack::addressToString(const struct sockaddr* address) {
    char buffer[INET6_ADDRSTRLEN] = {0};
    if (address->sa_family == AF_INET) {
        auto* in = reinterpret_cast<const sockaddr_in*>(address);
        inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer));
    } else if (address->sa_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const sockaddr_in6*>(address);
        inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer));
    }
    return buffer;
}

int NetworkStack::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    addrinfo* results = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results);
    if (rc != 0) {
        networkError("Cannot resolve " + host + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(results, &freeaddrinfo);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string lastError = "no usable address";

    for (addrinfo* info = results; info != nullptr; info = info->ai_next) {
        int sock = socket(info->ai_family, info->ai_socktype | SOCK_CLOEXEC, info->ai_protocol);
        if (sock < 0) {
            lastError = strerror(errno);
            continue;
        }

        if (!setNonBlocking(sock, true)) {
            lastError = "Failed to set non-blocking mode";
            close(sock);
            continue;
        }

        int result = ::connect(sock, info->ai_addr, info->ai_addrlen);
        if (result < 0 && errno == EINPROGRESS) {
            if (waitFor(sock, POLLOUT, deadline)) {
                int error = 0;
                socklen_t len = sizeof(error);
                getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len);
                result = error == 0 ? 0 : -1;
                if (error != 0) lastError = strerror(error);
            } else {
                lastError = "connection timed out";
            }
        } else if (result < 0) {
            lastError = strerror(errno);
        }

        if (result == 0 && setNonBlocking(sock, false) && setSocketOptions(sock)) {
            Logger::logEvent(LogLevel::Debug,
                "Connected to " + host + ":" + std::to_string(port));
            return sock;
        }
        close(sock);
    }

    networkError("Failed to connect to " + host + ":" + std::to_string(port) + ": " + lastError);
}

void NetworkStack::sendAll(int socket, std::string_view data, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t total_sent = 0;

    while (total_sent < data.size()) {
        ssize_t sent = send(socket, data.data() + total_sent,
            data.size() - total_sent, MSG_NOSIGNAL | MSG_DONTWAIT);

        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (!waitFor(socket, POLLOUT, deadline)) {
                    networkError("Send timed out");
                }
                continue;
            }
            networkError("Send failed: " + std::string(strerror(errno)));
        }
        total_sent += static_cast<size_t>(sent);
    }
}

std::optional<std::string> NetworkStack::readLine(int socket, size_t maxSize,
    std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string line;
    char buffer[PEEK_SIZE];

    while (true) {
        if (!waitFor(socket, POLLIN, deadline)) {
            networkError("Timed out waiting for identity");
        }

        ssize_t peeked = recv(socket, buffer, sizeof(buffer), MSG_PEEK | MSG_DONTWAIT);
        if (peeked < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            networkError("Receive failed: " + std::string(strerror(errno)));
        }
        if (peeked == 0) {
            return std::nullopt;
        }

        // Consume up to and including the newline only
        auto* newline = static_cast<char*>(memchr(buffer, '\n', static_cast<size_t>(peeked)));
        size_t wanted = newline ? static_cast<size_t>(newline - buffer) + 1 : static_cast<size_t>(peeked);

        ssize_t received = recv(socket, buffer, wanted, MSG_DONTWAIT);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            networkError("Receive failed: " + std::string(strerror(errno)));
        }
        line.append(buffer, static_cast<size_t>(received));

        if (line.size() > maxSize + 1) {
            throw ProtocolError(ErrorCode::MalformedPacket, "Identity exceeds maximum packet size");
        }
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            return line;
        }
    }
}

void NetworkStack::shutdownSocket(int socket) {
    if (socket >= 0) {
        ::shutdown(socket, SHUT_RDWR);
    }
}

void NetworkStack::closeSocket(int socket) {
    if (socket >= 0) {
        close(socket);
    }
}

ControlListener::ControlListener(uint16_t minPort, uint16_t maxPort, std::chrono::milliseconds rateLimit)
    : min_port_(minPort), max_port_(maxPort), rate_limiter_(rateLimit) {}

ControlListener::~ControlListener() {
    stop();
}

bool ControlListener::start(ConnectionHandler handler) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        if (running_.load() || listen_socket_.load() >= 0) {
            throw std::runtime_error("Listener already running");
        }

        int server_sock = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (server_sock < 0) {
            throw std::runtime_error("Failed to create server socket");
        }

        // Enable address reuse
        int reuse = 1;
        if (setsockopt(server_sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            close(server_sock);
            throw std::runtime_error("Failed to set SO_REUSEADDR");
        }

        uint16_t bound = 0;
        for (uint32_t port = min_port_; port <= max_port_; ++port) {
            sockaddr_in server_addr{};
            server_addr.sin_family = AF_INET;
            server_addr.sin_addr.s_addr = INADDR_ANY;
            server_addr.sin_port = htons(static_cast<uint16_t>(port));

            if (bind(server_sock, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) == 0) {
                bound = static_cast<uint16_t>(port);
                break;
            }
            if (errno != EADDRINUSE && errno != EACCES) {
                int err = errno;
                close(server_sock);
                throw std::runtime_error("Failed to bind server socket: " + std::string(strerror(err)));
            }
        }

        if (bound == 0) {
            close(server_sock);
            throw std::runtime_error("No free port in " + std::to_string(min_port_) + "-" +
                std::to_string(max_port_));
        }

        if (listen(server_sock, BACKLOG) < 0) {
            close(server_sock);
            throw std::runtime_error("Failed to listen on server socket");
        }

        listen_socket_ = server_sock;
        port_ = bound;
        handler_ = std::move(handler);
        running_ = true;

        accept_thread_ = std::thread(&ControlListener::acceptLoop, this);

        Logger::logEvent(LogLevel::Info, "Control listener on port " + std::to_string(bound));
        return true;
    }
    catch (const std::exception& e) {
        Logger::logError(ErrorCode::NetworkError,
            std::string("Failed to start control listener: ") + e.what());
        return false;
    }
}

void ControlListener::acceptLoop() {
    while (running_) {
        pollfd pfd{listen_socket_.load(), POLLIN, 0};
        int poll_result = poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (poll_result < 0) {
            if (errno == EINTR) continue;
            Logger::logError(ErrorCode::NetworkError,
                "Poll failed: " + std::string(strerror(errno)));
            break;
        }
        if (poll_result == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        sockaddr_storage client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_sock = accept4(listen_socket_.load(),
            reinterpret_cast<sockaddr*>(&client_addr), &addr_len, SOCK_CLOEXEC);
        if (client_sock < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                Logger::logEvent(LogLevel::Warning,
                    "Accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }

        std::string address = NetworkStack::addressToString(reinterpret_cast<sockaddr*>(&client_addr));

        if (rate_limiter_.shouldDrop(address)) {
            Logger::logEvent(LogLevel::Debug, "Discarding rapid reconnect from " + address);
            close(client_sock);
            continue;
        }

        if (!NetworkStack::setSocketOptions(client_sock)) {
            close(client_sock);
            Logger::logEvent(LogLevel::Warning, "Failed to set options for client socket");
            continue;
        }

        try {
            handler_(client_sock, address);
        }
        catch (const std::exception& e) {
            Logger::logError(ErrorCode::NetworkError,
                "Connection handler failed for " + address + ": " + e.what());
        }
    }
}

void ControlListener::stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    running_ = false;
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    int sock = listen_socket_.exchange(-1);
    NetworkStack::closeSocket(sock);
    port_ = 0;
}

} // namespace cosmic_connect

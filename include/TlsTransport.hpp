#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "CertificateManager.hpp"
#include "CoreTypes.hpp"
#include "Transport.hpp"

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace cosmic_connect {

// TLS over an already connected TCP socket, in the role negotiated by the
// pairing handshake. Peer certificates are accepted unconditionally here;
// trust is decided by fingerprint afterwards.
class TlsTransport : public Transport {
    struct ConstructionKey {};

public:
    // Takes ownership of the socket. Throws ProtocolError(NetworkError) when
    // the handshake fails or does not finish within timeout.
    static std::shared_ptr<TlsTransport> establish(
        int socket,
        TlsRole role,
        const Certificate& localCertificate,
        const std::string& peerAddress,
        std::chrono::milliseconds timeout);

    TlsTransport(ConstructionKey, int socket, TlsRole role, std::string peerAddress);
    ~TlsTransport() override;

    TlsTransport(const TlsTransport&) = delete;
    TlsTransport& operator=(const TlsTransport&) = delete;

    void write(std::string_view data) override;
    ReadResult read(std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override { return open_.load(); }
    std::string peerAddress() const override { return peer_address_; }

    TlsRole role() const { return role_; }

    // DER encoding of the certificate the peer presented
    const std::vector<uint8_t>& peerCertificate() const { return peer_certificate_; }

private:
    static constexpr size_t READ_CHUNK = 16 * 1024;
    static constexpr std::chrono::milliseconds WRITE_TIMEOUT{10000};

    struct ContextDeleter {
        void operator()(SSL_CTX* ctx) const;
    };
    struct SessionDeleter {
        void operator()(SSL* ssl) const;
    };

    void handshake(const Certificate& localCertificate, std::chrono::milliseconds timeout);

    int socket_;
    TlsRole role_;
    std::string peer_address_;
    std::unique_ptr<SSL_CTX, ContextDeleter> ctx_;
    std::unique_ptr<SSL, SessionDeleter> ssl_;
    std::vector<uint8_t> peer_certificate_;
    std::atomic<bool> open_{false};

    // Guards every call into ssl_; never held while waiting on the socket
    std::mutex ssl_mutex_;
    // Keeps writes whole and ordered
    std::mutex write_mutex_;
};

} // namespace cosmic_connect

#include "TlsTransport.hpp"
#include "Crypto.hpp"
#include "Logger.hpp"
#include "NetworkStack.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace cosmic_connect {

namespace {
    struct BIODeleter {
        void operator()(BIO* bio) { BIO_free_all(bio); }
    };
    using BIOPtr = std::unique_ptr<BIO, BIODeleter>;

    struct X509Deleter {
        void operator()(X509* cert) { X509_free(cert); }
    };
    using X509Ptr = std::unique_ptr<X509, X509Deleter>;

    struct PKEYDeleter {
        void operator()(EVP_PKEY* key) { EVP_PKEY_free(key); }
    };
    using PKEYPtr = std::unique_ptr<EVP_PKEY, PKEYDeleter>;

    // Trust comes from the user confirming the fingerprint, not from a CA
    int acceptAnyCertificate(int, X509_STORE_CTX*) {
        return 1;
    }

    BIOPtr memoryBio(const std::string& pem) {
        BIOPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if (!bio) Crypto::throwOpenSSLError("BIO_new_mem_buf", ErrorCode::CertificateError);
        return bio;
    }

    // Waits for readiness; false when the deadline passed
    bool waitFor(int socket, short events, std::chrono::steady_clock::time_point deadline) {
        while (true) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left < 0) left = 0;

            pollfd pfd{socket, events, 0};
            int result = poll(&pfd, 1, static_cast<int>(left));
            if (result < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            return result > 0;
        }
    }
}

std::shared_ptr<TlsTransport> TlsTransport::establish(
    int socket,
    TlsRole role,
    const Certificate& localCertificate,
    const std::string& peerAddress,
    std::chrono::milliseconds timeout)
{
    auto transport = std::make_shared<TlsTransport>(ConstructionKey{}, socket, role, peerAddress);
    transport->handshake(localCertificate, timeout);
    return transport;
}

void TlsTransport::ContextDeleter::operator()(SSL_CTX* ctx) const {
    SSL_CTX_free(ctx);
}

void TlsTransport::SessionDeleter::operator()(SSL* ssl) const {
    SSL_free(ssl);
}

TlsTransport::TlsTransport(ConstructionKey, int socket, TlsRole role, std::string peerAddress)
    : socket_(socket), role_(role), peer_address_(std::move(peerAddress)) {}

TlsTransport::~TlsTransport() {
    close();
    ssl_.reset();
    ctx_.reset();
    NetworkStack::closeSocket(socket_);
}

void TlsTransport::handshake(const Certificate& localCertificate, std::chrono::milliseconds timeout) {
    ERR_clear_error();

    ctx_.reset(SSL_CTX_new(role_ == TlsRole::Server ? TLS_server_method() : TLS_client_method()));
    if (!ctx_) Crypto::throwOpenSSLError("SSL_CTX_new", ErrorCode::NetworkError);

    if (!SSL_CTX_set_min_proto_version(ctx_.get(), TLS1_2_VERSION)) {
        Crypto::throwOpenSSLError("SSL_CTX_set_min_proto_version", ErrorCode::NetworkError);
    }

    {
        BIOPtr certBio = memoryBio(localCertificate.certificatePem);
        X509Ptr cert(PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr));
        if (!cert || SSL_CTX_use_certificate(ctx_.get(), cert.get()) != 1) {
            Crypto::throwOpenSSLError("SSL_CTX_use_certificate");
        }

        BIOPtr keyBio = memoryBio(localCertificate.privateKeyPem);
        PKEYPtr key(PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr));
        if (!key || SSL_CTX_use_PrivateKey(ctx_.get(), key.get()) != 1) {
            Crypto::throwOpenSSLError("SSL_CTX_use_PrivateKey");
        }
        if (SSL_CTX_check_private_key(ctx_.get()) != 1) {
            Crypto::throwOpenSSLError("SSL_CTX_check_private_key");
        }
    }

    // Both sides must present a certificate
    int verifyMode = SSL_VERIFY_PEER;
    if (role_ == TlsRole::Server) {
        verifyMode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    }
    SSL_CTX_set_verify(ctx_.get(), verifyMode, acceptAnyCertificate);

    ssl_.reset(SSL_new(ctx_.get()));
    if (!ssl_) Crypto::throwOpenSSLError("SSL_new", ErrorCode::NetworkError);
    if (SSL_set_fd(ssl_.get(), socket_) != 1) Crypto::throwOpenSSLError("SSL_set_fd", ErrorCode::NetworkError);

    if (!NetworkStack::setNonBlocking(socket_, true)) {
        throw ProtocolError(ErrorCode::NetworkError, "Failed to set non-blocking mode");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        ERR_clear_error();
        int rc = role_ == TlsRole::Server ? SSL_accept(ssl_.get()) : SSL_connect(ssl_.get());
        if (rc == 1) {
            break;
        }

        int err = SSL_get_error(ssl_.get(), rc);
        bool ready = false;
        if (err == SSL_ERROR_WANT_READ) {
            ready = waitFor(socket_, POLLIN, deadline);
        } else if (err == SSL_ERROR_WANT_WRITE) {
            ready = waitFor(socket_, POLLOUT, deadline);
        } else {
            Crypto::throwOpenSSLError(std::string("TLS handshake as ") + toString(role_),
                ErrorCode::NetworkError);
        }
        if (!ready) {
            throw ProtocolError(ErrorCode::NetworkError, "TLS handshake timed out");
        }
    }

    X509Ptr peer(SSL_get_peer_certificate(ssl_.get()));
    if (!peer) {
        throw ProtocolError(ErrorCode::UntrustedCertificate, "Peer presented no certificate");
    }
    int len = i2d_X509(peer.get(), nullptr);
    if (len <= 0) Crypto::throwOpenSSLError("i2d_X509");
    peer_certificate_.resize(static_cast<size_t>(len));
    unsigned char* out = peer_certificate_.data();
    i2d_X509(peer.get(), &out);

    open_ = true;
    Logger::logEvent(LogLevel::Debug, std::string("TLS established as ") + toString(role_) +
        " with " + peer_address_ + " (" + SSL_get_version(ssl_.get()) + ")");
}

void TlsTransport::write(std::string_view data) {
    std::lock_guard<std::mutex> writeLock(write_mutex_);
    auto deadline = std::chrono::steady_clock::now() + WRITE_TIMEOUT;

    size_t written = 0;
    while (written < data.size()) {
        if (!open_) {
            throw ProtocolError(ErrorCode::NetworkError, "Transport is closed");
        }

        int rc = 0;
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            ERR_clear_error();
            rc = SSL_write(ssl_.get(), data.data() + written, static_cast<int>(data.size() - written));
            if (rc <= 0) {
                err = SSL_get_error(ssl_.get(), rc);
            }
        }

        if (rc > 0) {
            written += static_cast<size_t>(rc);
            continue;
        }

        bool ready = false;
        if (err == SSL_ERROR_WANT_WRITE) {
            ready = waitFor(socket_, POLLOUT, deadline);
        } else if (err == SSL_ERROR_WANT_READ) {
            ready = waitFor(socket_, POLLIN, deadline);
        } else {
            throw ProtocolError(ErrorCode::NetworkError,
                "TLS write to " + peer_address_ + " failed: " + std::strerror(errno));
        }
        if (!ready) {
            throw ProtocolError(ErrorCode::NetworkError, "TLS write to " + peer_address_ + " timed out");
        }
    }
}

Transport::ReadResult TlsTransport::read(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    ReadResult result;
    char buffer[READ_CHUNK];

    while (true) {
        if (!open_) {
            result.status = ReadStatus::Closed;
            return result;
        }

        int rc = 0;
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            ERR_clear_error();
            rc = SSL_read(ssl_.get(), buffer, sizeof(buffer));
            if (rc <= 0) {
                err = SSL_get_error(ssl_.get(), rc);
            }
        }

        if (rc > 0) {
            result.status = ReadStatus::Data;
            result.data.assign(buffer, static_cast<size_t>(rc));
            return result;
        }

        bool ready = false;
        if (err == SSL_ERROR_WANT_READ) {
            ready = waitFor(socket_, POLLIN, deadline);
        } else if (err == SSL_ERROR_WANT_WRITE) {
            ready = waitFor(socket_, POLLOUT, deadline);
        } else {
            if (err != SSL_ERROR_ZERO_RETURN) {
                Logger::logEvent(LogLevel::Debug, "TLS read from " + peer_address_ + " ended");
            }
            open_ = false;
            result.status = ReadStatus::Closed;
            return result;
        }

        if (!ready) {
            result.status = ReadStatus::Timeout;
            return result;
        }
    }
}

void TlsTransport::close() {
    if (open_.exchange(false)) {
        std::lock_guard<std::mutex> lock(ssl_mutex_);
        ERR_clear_error();
        // Best effort close_notify on the non-blocking socket
        SSL_shutdown(ssl_.get());
    }
    NetworkStack::shutdownSocket(socket_);
}

} // namespace cosmic_connect

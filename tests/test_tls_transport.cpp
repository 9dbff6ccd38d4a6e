#include <gtest/gtest.h>
#include <cerrno>
#include <fcntl.h>
#include <future>
#include <sys/socket.h>
#include <unistd.h>
#include "CertificateManager.hpp"
#include "NetworkStack.hpp"
#include "TlsTransport.hpp"

using namespace cosmic_connect;
using namespace std::chrono_literals;

namespace {
    std::shared_ptr<const Certificate> certificateFor(const std::string& deviceId) {
        auto storage = std::make_shared<MemoryStorage>();
        storage->store(CertificateManager::KEY_DEVICE_ID,
            std::vector<uint8_t>(deviceId.begin(), deviceId.end()));
        return CertificateManager(storage).getOrCreateLocalCertificate();
    }

    class TlsTransportTest : public ::testing::Test {
    protected:
        static void SetUpTestSuite() {
            NetworkStack::initialize();
        }
    };
}

TEST_F(TlsTransportTest, HandshakeExchangesCertificatesAndData) {
    auto serverCertificate = certificateFor("zzz");
    auto clientCertificate = certificateFor("aaa");
    int sockets[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sockets), 0);

    auto server = std::async(std::launch::async, [&] {
        return TlsTransport::establish(sockets[0], TlsRole::Server, *serverCertificate, "client", 5000ms);
    });
    auto client = TlsTransport::establish(sockets[1], TlsRole::Client, *clientCertificate, "server", 5000ms);
    auto accepted = server.get();

    EXPECT_EQ(accepted->peerCertificate(), clientCertificate->der);
    EXPECT_EQ(client->peerCertificate(), serverCertificate->der);
    EXPECT_EQ(accepted->role(), TlsRole::Server);
    EXPECT_EQ(client->peerAddress(), "server");

    client->write("hello\n");
    auto received = accepted->read(2000ms);
    ASSERT_EQ(received.status, Transport::ReadStatus::Data);
    EXPECT_EQ(received.data, "hello\n");

    client->close();
    EXPECT_FALSE(client->isOpen());
    EXPECT_EQ(accepted->read(2000ms).status, Transport::ReadStatus::Closed);
    EXPECT_THROW(client->write("late\n"), ProtocolError);
}

TEST_F(TlsTransportTest, FailedHandshakeReleasesSocket) {
    auto certificate = certificateFor("aaa");
    int sockets[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sockets), 0);
    close(sockets[1]);

    try {
        TlsTransport::establish(sockets[0], TlsRole::Client, *certificate, "gone", 2000ms);
        FAIL() << "Handshake with a closed peer succeeded";
    }
    catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NetworkError);
    }
    errno = 0;
    EXPECT_EQ(fcntl(sockets[0], F_GETFD), -1);
    EXPECT_EQ(errno, EBADF);
}

TEST_F(TlsTransportTest, SilentPeerTimesOut) {
    auto certificate = certificateFor("aaa");
    int sockets[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sockets), 0);

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(TlsTransport::establish(sockets[0], TlsRole::Server, *certificate, "silent", 200ms),
        ProtocolError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    close(sockets[1]);
}

#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include <sys/socket.h>
#include "PairingManager.hpp"
#include "NetworkStack.hpp"

using namespace cosmic_connect;
using namespace std::chrono_literals;

namespace {
    CoreConfig testConfig(std::chrono::milliseconds pairingTimeout = 5000ms) {
        CoreConfig config;
        config.handshakeTimeout = 5000ms;
        config.pairingTimeout = pairingTimeout;
        return config;
    }

    // One device with its own storage, certificate and trust records
    struct TestDevice {
        // claimedId differs from deviceId only for a device lying about who it is
        TestDevice(const std::string& deviceId, const CoreConfig& config = testConfig(),
            const std::string& claimedId = {})
            : storage(std::make_shared<MemoryStorage>()) {
            std::string id = deviceId;
            storage->store(CertificateManager::KEY_DEVICE_ID, std::vector<uint8_t>(id.begin(), id.end()));
            certificates = std::make_shared<CertificateManager>(storage);
            trust = std::make_shared<TrustStore>(storage);
            pairing = std::make_unique<PairingManager>(config, certificates, trust);
            CoreConfig named = config;
            named.deviceName = "Device " + deviceId;
            identity = IdentityModel::buildLocalIdentity(named,
                claimedId.empty() ? deviceId : claimedId, 1716, {"cconnect.ping"}, {});
        }

        std::string fingerprint() {
            return certificates->getOrCreateLocalCertificate()->fingerprint;
        }

        std::shared_ptr<MemoryStorage> storage;
        std::shared_ptr<CertificateManager> certificates;
        std::shared_ptr<TrustStore> trust;
        std::unique_ptr<PairingManager> pairing;
        DeviceIdentity identity;
    };

    struct Outcome {
        std::optional<HandshakeResult> result;
        ErrorCode error = ErrorCode::None;
    };

    Outcome runHandshake(TestDevice& device, int socket, const HandshakeOptions& options) {
        Outcome outcome;
        try {
            outcome.result = device.pairing->handshake(socket, "socketpair", device.identity, options);
        }
        catch (const ProtocolError& e) {
            outcome.error = e.code();
        }
        return outcome;
    }

    // Runs both ends concurrently; the initiator asks the responder by id
    std::pair<Outcome, Outcome> connect(TestDevice& initiator, TestDevice& responder, bool requestPairing) {
        int sockets[2];
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, sockets) != 0) {
            throw std::runtime_error("socketpair failed");
        }

        HandshakeOptions initiatorOptions;
        initiatorOptions.expectedDeviceId = responder.identity.deviceId;
        initiatorOptions.requestPairing = requestPairing;

        auto initiated = std::async(std::launch::async, [&] {
            return runHandshake(initiator, sockets[0], initiatorOptions);
        });
        auto responded = std::async(std::launch::async, [&] {
            return runHandshake(responder, sockets[1], HandshakeOptions{});
        });

        std::pair<Outcome, Outcome> outcomes{initiated.get(), responded.get()};
        for (auto* outcome : {&outcomes.first, &outcomes.second}) {
            if (outcome->result && outcome->result->transport) {
                outcome->result->transport->close();
            }
        }
        return outcomes;
    }

    class PairingTest : public ::testing::Test {
    protected:
        static void SetUpTestSuite() {
            NetworkStack::initialize();
        }
    };
}

TEST_F(PairingTest, GreaterIdIsTlsServer) {
    EXPECT_EQ(PairingManager::determineRole("zzz", "aaa"), TlsRole::Server);
    EXPECT_EQ(PairingManager::determineRole("aaa", "zzz"), TlsRole::Client);
    EXPECT_EQ(PairingManager::determineRole("abc", "abd"), TlsRole::Client);
    EXPECT_EQ(PairingManager::determineRole("abd", "abc"), TlsRole::Server);
}

TEST_F(PairingTest, EqualIdsAreSelfPairing) {
    try {
        PairingManager::determineRole("same", "same");
        FAIL() << "Equal ids were accepted";
    }
    catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SelfPairing);
    }
}

TEST_F(PairingTest, PairsAfterAcceptAndReconnectsWithoutPrompt) {
    TestDevice aaa("aaa");
    TestDevice zzz("zzz");

    std::string shownKey;
    PairState stateDuringPrompt = PairState::Unpaired;
    zzz.pairing->setPairRequestHandler([&](const PairingRequest& request) {
        shownKey = request.verificationKey;
        stateDuringPrompt = zzz.pairing->pairState(request.deviceId);
        EXPECT_EQ(request.deviceId, "aaa");
        EXPECT_EQ(request.fingerprint, aaa.fingerprint());
        zzz.pairing->acceptPairing(request.deviceId);
    });

    auto [initiator, responder] = connect(aaa, zzz, true);
    ASSERT_EQ(initiator.error, ErrorCode::None);
    ASSERT_EQ(responder.error, ErrorCode::None);

    EXPECT_EQ(initiator.result->role, TlsRole::Client);
    EXPECT_EQ(responder.result->role, TlsRole::Server);
    EXPECT_TRUE(initiator.result->newlyPaired);
    EXPECT_TRUE(responder.result->newlyPaired);
    EXPECT_EQ(initiator.result->remoteIdentity.deviceId, "zzz");
    EXPECT_EQ(responder.result->remoteIdentity.deviceId, "aaa");

    EXPECT_EQ(stateDuringPrompt, PairState::PairRequestedIncoming);
    EXPECT_EQ(shownKey, CertificateManager::verificationKey(aaa.fingerprint(), zzz.fingerprint()));

    ASSERT_TRUE(aaa.trust->isTrusted("zzz"));
    ASSERT_TRUE(zzz.trust->isTrusted("aaa"));
    EXPECT_EQ(aaa.trust->find("zzz")->certificateFingerprint, zzz.fingerprint());
    EXPECT_EQ(zzz.trust->find("aaa")->certificateFingerprint, aaa.fingerprint());
    EXPECT_EQ(aaa.pairing->pairState("zzz"), PairState::Paired);

    // Second connection: no prompt, no new trust records
    std::atomic<int> prompts{0};
    zzz.pairing->setPairRequestHandler([&](const PairingRequest& request) {
        ++prompts;
        zzz.pairing->rejectPairing(request.deviceId);
    });

    auto [again, againResponder] = connect(aaa, zzz, false);
    ASSERT_EQ(again.error, ErrorCode::None);
    ASSERT_EQ(againResponder.error, ErrorCode::None);
    EXPECT_FALSE(again.result->newlyPaired);
    EXPECT_FALSE(againResponder.result->newlyPaired);
    EXPECT_EQ(prompts.load(), 0);
}

TEST_F(PairingTest, InitiatorMayBeTlsServer) {
    TestDevice aaa("aaa");
    TestDevice zzz("zzz");
    aaa.pairing->setPairRequestHandler([&](const PairingRequest& request) {
        EXPECT_EQ(request.deviceId, "zzz");
        aaa.pairing->acceptPairing(request.deviceId);
    });

    auto [initiator, responder] = connect(zzz, aaa, true);
    ASSERT_EQ(initiator.error, ErrorCode::None);
    ASSERT_EQ(responder.error, ErrorCode::None);

    EXPECT_EQ(initiator.result->role, TlsRole::Server);
    EXPECT_EQ(responder.result->role, TlsRole::Client);
    EXPECT_TRUE(initiator.result->newlyPaired);
    EXPECT_TRUE(responder.result->newlyPaired);
    EXPECT_EQ(initiator.result->peerFingerprint, aaa.fingerprint());
    EXPECT_EQ(responder.result->peerFingerprint, zzz.fingerprint());

    ASSERT_TRUE(zzz.trust->isTrusted("aaa"));
    ASSERT_TRUE(aaa.trust->isTrusted("zzz"));
    EXPECT_EQ(zzz.trust->find("aaa")->certificateFingerprint, aaa.fingerprint());
    EXPECT_EQ(aaa.trust->find("zzz")->certificateFingerprint, zzz.fingerprint());
}

TEST_F(PairingTest, CertificateIssuedToAnotherDeviceIsRefused) {
    // Holds the certificate of aaa but announces itself as mmm
    TestDevice impostor("aaa", testConfig(), "mmm");
    TestDevice zzz("zzz");
    std::atomic<int> prompts{0};
    zzz.pairing->setPairRequestHandler([&](const PairingRequest& request) {
        ++prompts;
        zzz.pairing->acceptPairing(request.deviceId);
    });

    auto [initiator, responder] = connect(impostor, zzz, true);
    EXPECT_EQ(responder.error, ErrorCode::UntrustedCertificate);
    EXPECT_NE(initiator.error, ErrorCode::None);
    EXPECT_EQ(prompts.load(), 0);
    EXPECT_FALSE(zzz.trust->isTrusted("mmm"));
    EXPECT_FALSE(zzz.trust->isTrusted("aaa"));
    EXPECT_FALSE(impostor.trust->isTrusted("zzz"));
}

TEST_F(PairingTest, ChangedCertificateOfPairedDeviceIsRefused) {
    TestDevice aaa("aaa");
    TestDevice zzz("zzz");
    zzz.pairing->setPairRequestHandler([&](const PairingRequest& request) {
        zzz.pairing->acceptPairing(request.deviceId);
    });

    auto [first, firstResponder] = connect(aaa, zzz, true);
    ASSERT_EQ(first.error, ErrorCode::None);
    std::string pairedFingerprint = zzz.fingerprint();

    zzz.certificates->regenerateLocalCertificate();
    ASSERT_NE(zzz.fingerprint(), pairedFingerprint);

    auto [second, secondResponder] = connect(aaa, zzz, false);
    EXPECT_EQ(second.error, ErrorCode::UntrustedCertificate);
    EXPECT_EQ(aaa.trust->find("zzz")->certificateFingerprint, pairedFingerprint);
}

TEST_F(PairingTest, RejectedRequestRecordsNoTrust) {
    TestDevice aaa("aaa");
    TestDevice zzz("zzz");
    zzz.pairing->setPairRequestHandler([&](const PairingRequest& request) {
        zzz.pairing->rejectPairing(request.deviceId);
    });

    auto [initiator, responder] = connect(aaa, zzz, true);
    EXPECT_EQ(initiator.error, ErrorCode::PairingRejected);
    EXPECT_EQ(responder.error, ErrorCode::PairingRejected);
    EXPECT_FALSE(aaa.trust->isTrusted("zzz"));
    EXPECT_FALSE(zzz.trust->isTrusted("aaa"));
    EXPECT_EQ(aaa.pairing->pairState("zzz"), PairState::Unpaired);
}

TEST_F(PairingTest, MissingHandlerRejects) {
    TestDevice aaa("aaa");
    TestDevice zzz("zzz");

    auto [initiator, responder] = connect(aaa, zzz, true);
    EXPECT_EQ(initiator.error, ErrorCode::PairingRejected);
    EXPECT_FALSE(zzz.trust->isTrusted("aaa"));
}

TEST_F(PairingTest, UnansweredRequestTimesOut) {
    TestDevice aaa("aaa");
    TestDevice zzz("zzz", testConfig(300ms));
    zzz.pairing->setPairRequestHandler([](const PairingRequest&) {});

    auto [initiator, responder] = connect(aaa, zzz, true);
    EXPECT_EQ(responder.error, ErrorCode::PairingTimeout);
    EXPECT_NE(initiator.error, ErrorCode::None);
    EXPECT_FALSE(aaa.trust->isTrusted("zzz"));
    EXPECT_FALSE(zzz.trust->isTrusted("aaa"));
    EXPECT_EQ(zzz.pairing->pairState("aaa"), PairState::Unpaired);
}

TEST_F(PairingTest, CancelAbortsWaitingResponder) {
    TestDevice aaa("aaa");
    TestDevice zzz("zzz");

    std::promise<void> prompted;
    zzz.pairing->setPairRequestHandler([&](const PairingRequest&) {
        prompted.set_value();
    });

    auto canceller = std::async(std::launch::async, [&] {
        prompted.get_future().wait();
        return zzz.pairing->cancelPairing("aaa");
    });

    auto [initiator, responder] = connect(aaa, zzz, true);
    EXPECT_TRUE(canceller.get());
    EXPECT_EQ(responder.error, ErrorCode::PairingCancelled);
    EXPECT_NE(initiator.error, ErrorCode::None);
    EXPECT_FALSE(zzz.trust->isTrusted("aaa"));
    EXPECT_FALSE(zzz.pairing->acceptPairing("aaa"));
}

TEST_F(PairingTest, WrongExpectedDeviceIsRefused) {
    TestDevice aaa("aaa");
    TestDevice zzz("zzz");

    int sockets[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sockets), 0);

    HandshakeOptions options;
    options.expectedDeviceId = "mmm";
    auto initiated = std::async(std::launch::async, [&] {
        return runHandshake(aaa, sockets[0], options);
    });
    auto responded = std::async(std::launch::async, [&] {
        return runHandshake(zzz, sockets[1], HandshakeOptions{});
    });

    // aaa expected mmm; zzz sees an identity addressed to someone else
    EXPECT_EQ(initiated.get().error, ErrorCode::InvalidIdentity);
    EXPECT_EQ(responded.get().error, ErrorCode::InvalidIdentity);
}

TEST_F(PairingTest, PairPacketsHaveWireShape) {
    Packet request = PairingManager::makePairRequest("ABCD", "Laptop");
    EXPECT_EQ(request.type, protocol::PACKET_TYPE_PAIR);
    EXPECT_TRUE(request.getBool("pair"));
    EXPECT_EQ(request.getString("fingerprint"), "ABCD");
    EXPECT_EQ(request.getString("deviceName"), "Laptop");

    Packet response = PairingManager::makePairResponse(false);
    EXPECT_FALSE(response.getBool("pair", true));
    EXPECT_TRUE(response.getBool("response"));

    Packet unpair = PairingManager::makeUnpair();
    EXPECT_FALSE(unpair.getBool("pair", true));
    EXPECT_FALSE(unpair.body.contains("response"));
}

#include <gtest/gtest.h>
#include <thread>
#include "TrustStore.hpp"
#include "CoreTypes.hpp"

using namespace cosmic_connect;

namespace {
    TrustedPeer makePeer(const std::string& id, const std::string& fingerprint, int version = 8) {
        return TrustedPeer{id, fingerprint, "Device " + id, version};
    }

    class TrustStoreTest : public ::testing::Test {
    protected:
        std::shared_ptr<MemoryStorage> storage = std::make_shared<MemoryStorage>();
        TrustStore store{storage};
    };
}

TEST_F(TrustStoreTest, AddAndFind) {
    store.add(makePeer("phone", "AA11"));

    auto peer = store.find("phone");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(*peer, makePeer("phone", "AA11"));
    EXPECT_TRUE(store.isTrusted("phone"));
    EXPECT_FALSE(store.isTrusted("tablet"));
}

TEST_F(TrustStoreTest, RecordsSurviveNewInstance) {
    store.add(makePeer("phone", "AA11"));

    TrustStore reopened(storage);
    ASSERT_TRUE(reopened.find("phone").has_value());
    EXPECT_EQ(*reopened.find("phone"), makePeer("phone", "AA11"));
    ASSERT_EQ(reopened.list().size(), 1u);
}

TEST_F(TrustStoreTest, RefusesSecondFingerprintForSameDevice) {
    store.add(makePeer("phone", "AA11"));
    try {
        store.add(makePeer("phone", "BB22"));
        FAIL() << "A second certificate was accepted";
    }
    catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UntrustedCertificate);
    }
    EXPECT_EQ(store.find("phone")->certificateFingerprint, "AA11");
}

TEST_F(TrustStoreTest, ReAddingSameFingerprintUpdatesName) {
    store.add(makePeer("phone", "AA11"));
    TrustedPeer renamed = makePeer("phone", "AA11");
    renamed.displayName = "Renamed";
    store.add(renamed);

    EXPECT_EQ(store.find("phone")->displayName, "Renamed");
    EXPECT_EQ(store.list().size(), 1u);
}

TEST_F(TrustStoreTest, ProtocolVersionOnlyRises) {
    store.add(makePeer("phone", "AA11", 7));
    store.updateProtocolVersion("phone", 8);
    EXPECT_EQ(store.find("phone")->protocolVersion, 8);

    store.updateProtocolVersion("phone", 7);
    EXPECT_EQ(store.find("phone")->protocolVersion, 8);
}

TEST_F(TrustStoreTest, RemoveForgetsDevice) {
    store.add(makePeer("phone", "AA11"));
    store.add(makePeer("tablet", "CC33"));

    EXPECT_TRUE(store.remove("phone"));
    EXPECT_FALSE(store.remove("phone"));
    EXPECT_FALSE(store.isTrusted("phone"));

    auto peers = store.list();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].deviceId, "tablet");

    // After unpairing a new certificate may be trusted
    EXPECT_NO_THROW(store.add(makePeer("phone", "DD44")));
}

TEST_F(TrustStoreTest, CorruptRecordIsNotTrusted) {
    std::string garbage = "{broken";
    storage->store(std::string(TrustStore::KEY_PREFIX) + "phone",
        std::vector<uint8_t>(garbage.begin(), garbage.end()));
    EXPECT_FALSE(store.isTrusted("phone"));
}

TEST_F(TrustStoreTest, RejectsInvalidIdsAndEmptyFingerprints) {
    EXPECT_THROW(store.add(makePeer("../etc", "AA11")), ProtocolError);
    EXPECT_THROW(store.add(makePeer("phone", "")), ProtocolError);
}

TEST_F(TrustStoreTest, ConcurrentAddsOfDifferentDevicesAllLand) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, i] {
            store.add(makePeer("device_" + std::to_string(i), "FP" + std::to_string(i)));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(store.list().size(), 8u);
}

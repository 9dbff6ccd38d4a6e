#include <gtest/gtest.h>
#include "DeviceIdentity.hpp"
#include "PacketCodec.hpp"

using namespace cosmic_connect;
using json = nlohmann::json;

namespace {
    Packet identityPacket(json body) {
        return Packet::create(protocol::PACKET_TYPE_IDENTITY, std::move(body));
    }

    json validBody() {
        return {
            {"deviceId", "phone_1234"},
            {"deviceName", "Pixel"},
            {"deviceType", "phone"},
            {"protocolVersion", 8},
            {"incomingCapabilities", {"cconnect.ping"}},
            {"outgoingCapabilities", {"cconnect.battery"}},
            {"tcpPort", 1716}
        };
    }

    ErrorCode parseError(json body) {
        try {
            IdentityModel::fromPacket(identityPacket(std::move(body)));
        }
        catch (const ProtocolError& e) {
            return e.code();
        }
        return ErrorCode::None;
    }
}

TEST(IdentityModelTest, BuildsLocalIdentityFromConfig) {
    CoreConfig config;
    config.deviceName = "  Workstation  ";
    config.deviceType = DeviceType::Laptop;

    auto identity = IdentityModel::buildLocalIdentity(config, "local_device", 1714,
        {"cconnect.ping", "cconnect.battery", "cconnect.ping"}, {"cconnect.ping"});

    EXPECT_EQ(identity.deviceId, "local_device");
    EXPECT_EQ(identity.deviceName, "Workstation");
    EXPECT_EQ(identity.deviceType, DeviceType::Laptop);
    EXPECT_EQ(identity.protocolVersion, PROTOCOL_VERSION);
    EXPECT_EQ(identity.tcpPort, 1714);
    EXPECT_EQ(identity.incomingCapabilities,
        (std::vector<std::string>{"cconnect.battery", "cconnect.ping"}));
    EXPECT_FALSE(identity.targetDeviceId.has_value());
}

TEST(IdentityModelTest, BuildRejectsUnusableDeviceId) {
    CoreConfig config;
    EXPECT_THROW(IdentityModel::buildLocalIdentity(config, "bad id!", 1714, {}, {}), ProtocolError);
    EXPECT_THROW(IdentityModel::buildLocalIdentity(config, "", 1714, {}, {}), ProtocolError);
}

TEST(IdentityModelTest, PacketConversionKeepsAllFields) {
    CoreConfig config;
    auto identity = IdentityModel::buildLocalIdentity(config, "abc", 1720, {"x.in"}, {"x.out"});
    identity.targetDeviceId = "remote";
    identity.targetProtocolVersion = 8;

    Packet packet = IdentityModel::toPacket(identity);
    EXPECT_EQ(packet.type, protocol::PACKET_TYPE_IDENTITY);

    auto parsed = IdentityModel::fromPacket(PacketCodec::decode(PacketCodec::encode(packet)));
    EXPECT_EQ(parsed, identity);
}

TEST(IdentityModelTest, ParsesRemoteIdentity) {
    auto identity = IdentityModel::fromPacket(identityPacket(validBody()));
    EXPECT_EQ(identity.deviceId, "phone_1234");
    EXPECT_EQ(identity.deviceType, DeviceType::Phone);
    EXPECT_EQ(identity.tcpPort, 1716);
    EXPECT_EQ(identity.outgoingCapabilities, std::vector<std::string>{"cconnect.battery"});
}

TEST(IdentityModelTest, MissingRequiredFieldsAreInvalid) {
    for (const char* field : {"deviceId", "deviceName", "protocolVersion"}) {
        json body = validBody();
        body.erase(field);
        EXPECT_EQ(parseError(body), ErrorCode::InvalidIdentity) << field;
    }
}

TEST(IdentityModelTest, ProtocolVersionOutsideRangeIsInvalid) {
    json body = validBody();
    body["protocolVersion"] = MIN_PROTOCOL_VERSION - 1;
    EXPECT_EQ(parseError(body), ErrorCode::InvalidIdentity);

    body["protocolVersion"] = PROTOCOL_VERSION + 1;
    EXPECT_EQ(parseError(body), ErrorCode::InvalidIdentity);

    body["protocolVersion"] = "8";
    EXPECT_EQ(parseError(body), ErrorCode::InvalidIdentity);

    body["protocolVersion"] = MIN_PROTOCOL_VERSION;
    EXPECT_EQ(parseError(body), ErrorCode::None);
}

TEST(IdentityModelTest, WrongPacketTypeIsInvalid) {
    EXPECT_THROW(IdentityModel::fromPacket(Packet::create("cconnect.ping", validBody())), ProtocolError);
}

TEST(IdentityModelTest, UnknownDeviceTypeReadsAsDesktop) {
    json body = validBody();
    body["deviceType"] = "toaster";
    EXPECT_EQ(IdentityModel::fromPacket(identityPacket(body)).deviceType, DeviceType::Desktop);
}

TEST(IdentityModelTest, TcpPortMustBeInRange) {
    json body = validBody();
    body["tcpPort"] = 70000;
    EXPECT_EQ(parseError(body), ErrorCode::InvalidIdentity);
}

TEST(IdentityModelTest, SanitizesDeviceNames) {
    EXPECT_EQ(IdentityModel::sanitizeDeviceName("  name \t"), "name");
    EXPECT_EQ(IdentityModel::sanitizeDeviceName(std::string(40, 'a')).size(),
        protocol::MAX_DEVICE_NAME_LENGTH);

    // 31 ASCII bytes followed by a two-byte character straddling the limit
    std::string name = std::string(31, 'b') + "\xC3\xA9" + "tail";
    EXPECT_EQ(IdentityModel::sanitizeDeviceName(name), std::string(31, 'b'));
}

TEST(IdentityModelTest, ValidatesDeviceIds) {
    EXPECT_TRUE(IdentityModel::isValidDeviceId("a1_B-2"));
    EXPECT_FALSE(IdentityModel::isValidDeviceId(""));
    EXPECT_FALSE(IdentityModel::isValidDeviceId("has space"));
    EXPECT_FALSE(IdentityModel::isValidDeviceId(std::string(protocol::MAX_DEVICE_ID_LENGTH + 1, 'a')));
}

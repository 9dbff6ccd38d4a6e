#include <gtest/gtest.h>
#include <functional>
#include "PacketCodec.hpp"
#include "CoreTypes.hpp"

using namespace cosmic_connect;
using json = nlohmann::json;

namespace {
    ErrorCode errorOf(const std::function<void()>& action) {
        try {
            action();
        }
        catch (const ProtocolError& e) {
            return e.code();
        }
        return ErrorCode::None;
    }
}

TEST(PacketCodecTest, EncodesOneLineTerminatedByNewline) {
    Packet packet = Packet::create("cconnect.ping", {{"message", "hi\nthere"}});
    std::string frame = PacketCodec::encode(packet);

    ASSERT_FALSE(frame.empty());
    EXPECT_EQ(frame.back(), '\n');
    EXPECT_EQ(frame.find('\n'), frame.size() - 1);
}

TEST(PacketCodecTest, DecodeRestoresEncodedPacket) {
    Packet packet = Packet::create("cconnect.battery", {{"charge", 42}, {"isCharging", true}});
    packet.payloadSize = 1024;
    packet.payloadPort = 1739;

    Packet decoded = PacketCodec::decode(PacketCodec::encode(packet));
    EXPECT_EQ(decoded, packet);
    EXPECT_TRUE(decoded.hasPayload());
    EXPECT_EQ(decoded.getInt("charge"), 42);
    EXPECT_TRUE(decoded.getBool("isCharging"));
}

TEST(PacketCodecTest, LargeIntegersSurviveExactly) {
    const int64_t id = 9007199254740993LL;  // not representable as a double
    Packet packet = Packet::create("cconnect.test", {{"counter", id}});
    packet.id = id;

    Packet decoded = PacketCodec::decode(PacketCodec::encode(packet));
    EXPECT_EQ(decoded.id, id);
    EXPECT_EQ(decoded.getInt("counter"), id);
    EXPECT_TRUE(decoded.body["counter"].is_number_integer());
}

TEST(PacketCodecTest, UnknownFieldsArePreserved) {
    std::string frame =
        R"({"id":1,"type":"cconnect.future","body":{"known":1,"nested":{"x":[1,2]}},"flags":7})" "\n";

    Packet decoded = PacketCodec::decode(frame);
    EXPECT_EQ(decoded.body["nested"]["x"], json::array({1, 2}));
    EXPECT_EQ(decoded.extra["flags"], 7);

    json reencoded = json::parse(PacketCodec::encode(decoded));
    EXPECT_EQ(reencoded, json::parse(frame));
}

TEST(PacketCodecTest, RejectsFramesWithoutType) {
    EXPECT_EQ(errorOf([] { PacketCodec::decode(R"({"id":1,"body":{}})"); }), ErrorCode::MalformedPacket);
    EXPECT_EQ(errorOf([] { PacketCodec::decode(R"({"id":1,"type":"","body":{}})"); }),
        ErrorCode::MalformedPacket);
}

TEST(PacketCodecTest, RejectsInvalidJson) {
    EXPECT_EQ(errorOf([] { PacketCodec::decode("{not json}"); }), ErrorCode::MalformedPacket);
    EXPECT_EQ(errorOf([] { PacketCodec::decode("[1,2,3]"); }), ErrorCode::MalformedPacket);
    EXPECT_EQ(errorOf([] { PacketCodec::decode(R"({"type":"a","body":5})"); }), ErrorCode::MalformedPacket);
}

TEST(PacketCodecTest, EncodeRejectsPacketWithoutType) {
    Packet packet;
    EXPECT_EQ(errorOf([&] { PacketCodec::encode(packet); }), ErrorCode::MalformedPacket);
}

TEST(PacketCodecTest, DecodeStreamSplitsFirstFrame) {
    std::string first = PacketCodec::encode(Packet::create("a.one"));
    std::string second = PacketCodec::encode(Packet::create("a.two"));

    auto result = PacketCodec::decodeStream(first + second + "{\"type\":");
    ASSERT_TRUE(result.packet.has_value());
    EXPECT_EQ(result.packet->type, "a.one");
    EXPECT_EQ(result.remaining, second + "{\"type\":");

    auto next = PacketCodec::decodeStream(result.remaining);
    ASSERT_TRUE(next.packet.has_value());
    EXPECT_EQ(next.packet->type, "a.two");
    EXPECT_EQ(next.remaining, "{\"type\":");
}

TEST(PacketCodecTest, DecodeStreamWaitsForNewline) {
    auto result = PacketCodec::decodeStream(R"({"type":"a.partial","body":{})");
    EXPECT_FALSE(result.packet.has_value());
    EXPECT_EQ(result.remaining, R"({"type":"a.partial","body":{})");
}

TEST(PacketReaderTest, AssemblesPacketsAcrossReads) {
    std::string frame = PacketCodec::encode(Packet::create("cconnect.ping", {{"n", 1}}));

    PacketReader reader;
    for (size_t i = 0; i + 1 < frame.size(); ++i) {
        reader.feed(frame.substr(i, 1));
        EXPECT_FALSE(reader.next().has_value());
    }
    reader.feed(frame.substr(frame.size() - 1));

    auto packet = reader.next();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->getInt("n"), 1);
    EXPECT_EQ(reader.bufferedBytes(), 0u);
}

TEST(PacketReaderTest, SkipsBlankLinesAndRecoversFromGarbage) {
    PacketReader reader;
    reader.feed("\n\r\ngarbage\n");
    reader.feed(PacketCodec::encode(Packet::create("a.good")));

    EXPECT_EQ(errorOf([&] { reader.next(); }), ErrorCode::MalformedPacket);
    auto packet = reader.next();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type, "a.good");
}

TEST(PacketReaderTest, DiscardsOversizedFrameAndResyncs) {
    PacketReader reader(64);
    reader.feed(std::string(100, 'x'));
    EXPECT_EQ(errorOf([&] { reader.next(); }), ErrorCode::MalformedPacket);

    reader.feed(std::string(20, 'y') + "\n");
    reader.feed(PacketCodec::encode(Packet::create("a.after")));

    auto packet = reader.next();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type, "a.after");
}

TEST(PacketReaderTest, TakeBufferedReturnsUnconsumedBytes) {
    PacketReader reader;
    reader.feed(PacketCodec::encode(Packet::create("a.first")) + "{\"partial");
    ASSERT_TRUE(reader.next().has_value());

    EXPECT_EQ(reader.takeBuffered(), "{\"partial");
    EXPECT_EQ(reader.bufferedBytes(), 0u);
}

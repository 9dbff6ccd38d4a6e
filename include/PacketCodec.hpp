#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "Packet.hpp"
#include "Protocol.hpp"

namespace cosmic_connect {

class PacketCodec {
public:
    struct DecodeResult {
        std::optional<Packet> packet;
        std::string remaining;
    };

    // One line of compact JSON terminated by a single '\n'
    static std::string encode(const Packet& packet);

    // Parses a single frame; a trailing '\n' is optional
    static Packet decode(std::string_view frame);

    // Splits off the first complete frame. Without a newline the whole buffer
    // is returned as remaining. Throws ProtocolError(MalformedPacket) when the
    // first frame does not parse; the caller drops it and resumes after the
    // newline.
    static DecodeResult decodeStream(std::string_view buffer);

private:
    PacketCodec() = delete;
    ~PacketCodec() = delete;
    PacketCodec(const PacketCodec&) = delete;
    PacketCodec& operator=(const PacketCodec&) = delete;
};

// Accumulates bytes from successive reads and yields complete packets.
class PacketReader {
public:
    explicit PacketReader(size_t maxFrameSize = protocol::MAX_PACKET_SIZE);

    void feed(std::string_view data);

    // Next complete packet, or nullopt when more data is needed. A malformed
    // frame is consumed before ProtocolError is thrown, so the following call
    // continues with the next frame.
    std::optional<Packet> next();

    size_t bufferedBytes() const { return buffer_.size(); }
    void clear() { buffer_.clear(); }

    // Hands over the bytes not yet consumed, e.g. to the reader of the
    // session that continues on the same stream
    std::string takeBuffered();

private:
    std::string buffer_;
    size_t max_frame_size_;
    bool discarding_;
};

} // namespace cosmic_connect

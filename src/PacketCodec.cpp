#include "PacketCodec.hpp"
#include "CoreTypes.hpp"
#include <limits>

namespace cosmic_connect {

using json = nlohmann::json;

namespace {
    constexpr const char* KEY_ID = "id";
    constexpr const char* KEY_TYPE = "type";
    constexpr const char* KEY_BODY = "body";
    constexpr const char* KEY_PAYLOAD_SIZE = "payloadSize";
    constexpr const char* KEY_TRANSFER_INFO = "payloadTransferInfo";
    constexpr const char* KEY_PORT = "port";

    [[noreturn]] void malformed(const std::string& reason) {
        throw ProtocolError(ErrorCode::MalformedPacket, reason);
    }

    bool isBlank(std::string_view line) {
        for (char c : line) {
            if (c != ' ' && c != '\t' && c != '\r') {
                return false;
            }
        }
        return true;
    }

    // Integer value that fits in int64_t, or nullopt
    std::optional<int64_t> asInt64(const json& value) {
        if (value.is_number_unsigned()) {
            auto v = value.get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::nullopt;
            }
            return static_cast<int64_t>(v);
        }
        if (value.is_number_integer()) {
            return value.get<int64_t>();
        }
        return std::nullopt;
    }
}

std::string PacketCodec::encode(const Packet& packet) {
    if (packet.type.empty()) {
        malformed("Packet type must not be empty");
    }
    if (!packet.body.is_object()) {
        malformed("Packet body must be a JSON object");
    }

    json root = packet.extra.is_object() ? packet.extra : json::object();
    root[KEY_ID] = packet.id;
    root[KEY_TYPE] = packet.type;
    root[KEY_BODY] = packet.body;

    if (packet.payloadSize) {
        root[KEY_PAYLOAD_SIZE] = *packet.payloadSize;
    }
    if (packet.payloadPort) {
        json& info = root[KEY_TRANSFER_INFO];
        if (!info.is_object()) {
            info = json::object();
        }
        info[KEY_PORT] = *packet.payloadPort;
    }

    try {
        std::string line = root.dump(-1, ' ', false, json::error_handler_t::strict);
        line.push_back('\n');
        return line;
    }
    catch (const json::type_error& e) {
        malformed(std::string("Packet is not valid UTF-8: ") + e.what());
    }
}

Packet PacketCodec::decode(std::string_view frame) {
    if (!frame.empty() && frame.back() == '\n') {
        frame.remove_suffix(1);
    }
    if (frame.find('\n') != std::string_view::npos) {
        malformed("Frame contains more than one line");
    }

    json root;
    try {
        root = json::parse(frame.begin(), frame.end());
    }
    catch (const json::parse_error& e) {
        malformed(std::string("Frame is not valid JSON: ") + e.what());
    }

    if (!root.is_object()) {
        malformed("Frame is not a JSON object");
    }

    Packet packet;

    auto type = root.find(KEY_TYPE);
    if (type == root.end() || !type->is_string() || type->get<std::string>().empty()) {
        malformed("Frame lacks a type field");
    }
    packet.type = type->get<std::string>();
    root.erase(type);

    auto id = root.find(KEY_ID);
    if (id != root.end()) {
        auto value = asInt64(*id);
        if (!value) {
            malformed("Packet id is not an integer");
        }
        packet.id = *value;
        root.erase(id);
    }

    auto body = root.find(KEY_BODY);
    if (body != root.end()) {
        if (body->is_object()) {
            packet.body = std::move(*body);
        } else if (!body->is_null()) {
            malformed("Packet body is not an object");
        }
        root.erase(body);
    }

    auto payloadSize = root.find(KEY_PAYLOAD_SIZE);
    if (payloadSize != root.end()) {
        if (auto value = asInt64(*payloadSize)) {
            packet.payloadSize = *value;
            root.erase(payloadSize);
        }
    }

    auto transferInfo = root.find(KEY_TRANSFER_INFO);
    if (transferInfo != root.end() && transferInfo->is_object()) {
        auto port = transferInfo->find(KEY_PORT);
        if (port != transferInfo->end()) {
            auto value = asInt64(*port);
            if (value && *value > 0 && *value <= 65535) {
                packet.payloadPort = static_cast<uint16_t>(*value);
                transferInfo->erase(port);
            }
        }
        if (transferInfo->empty()) {
            root.erase(transferInfo);
        }
    }

    packet.extra = std::move(root);
    return packet;
}

PacketCodec::DecodeResult PacketCodec::decodeStream(std::string_view buffer) {
    DecodeResult result;

    size_t start = 0;
    while (true) {
        size_t newline = buffer.find('\n', start);
        if (newline == std::string_view::npos) {
            result.remaining = std::string(buffer.substr(start));
            return result;
        }

        std::string_view line = buffer.substr(start, newline - start);
        start = newline + 1;
        if (isBlank(line)) {
            continue;
        }

        result.packet = decode(line);
        result.remaining = std::string(buffer.substr(start));
        return result;
    }
}

PacketReader::PacketReader(size_t maxFrameSize)
    : max_frame_size_(maxFrameSize), discarding_(false) {}

void PacketReader::feed(std::string_view data) {
    buffer_.append(data.data(), data.size());
}

std::string PacketReader::takeBuffered() {
    std::string data = std::move(buffer_);
    buffer_.clear();
    discarding_ = false;
    return data;
}

std::optional<Packet> PacketReader::next() {
    while (true) {
        size_t newline = buffer_.find('\n');

        if (discarding_) {
            if (newline == std::string::npos) {
                buffer_.clear();
                return std::nullopt;
            }
            buffer_.erase(0, newline + 1);
            discarding_ = false;
            continue;
        }

        if (newline == std::string::npos) {
            if (buffer_.size() > max_frame_size_) {
                buffer_.clear();
                discarding_ = true;
                malformed("Frame exceeds maximum packet size");
            }
            return std::nullopt;
        }

        std::string line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);

        if (line.size() > max_frame_size_) {
            malformed("Frame exceeds maximum packet size");
        }
        if (isBlank(line)) {
            continue;
        }
        return PacketCodec::decode(line);
    }
}

} // namespace cosmic_connect

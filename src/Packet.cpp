#include "Packet.hpp"
#include "Utils.hpp"

namespace cosmic_connect {

Packet Packet::create(std::string_view type, nlohmann::json body) {
    Packet packet;
    packet.id = Utils::currentTimestampMs();
    packet.type = std::string(type);
    packet.body = body.is_object() ? std::move(body) : nlohmann::json::object();
    return packet;
}

std::string Packet::getString(const std::string& key, const std::string& fallback) const {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

int64_t Packet::getInt(const std::string& key, int64_t fallback) const {
    auto it = body.find(key);
    if (it == body.end() || !it->is_number_integer()) {
        return fallback;
    }
    return it->get<int64_t>();
}

bool Packet::getBool(const std::string& key, bool fallback) const {
    auto it = body.find(key);
    if (it == body.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

bool Packet::operator==(const Packet& other) const {
    return id == other.id &&
        type == other.type &&
        body == other.body &&
        payloadSize == other.payloadSize &&
        payloadPort == other.payloadPort &&
        extra == other.extra;
}

} // namespace cosmic_connect

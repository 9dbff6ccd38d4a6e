#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace cosmic_connect {

// One protocol message. The body belongs to the feature named by the type
// and is carried as opaque JSON.
struct Packet {
    int64_t id = 0;
    std::string type;
    nlohmann::json body = nlohmann::json::object();
    std::optional<int64_t> payloadSize;
    std::optional<uint16_t> payloadPort;
    // Top-level fields this core does not know about, kept for re-encoding
    nlohmann::json extra = nlohmann::json::object();

    // New packet with the current time in milliseconds as id
    static Packet create(std::string_view type,
        nlohmann::json body = nlohmann::json::object());

    bool hasPayload() const { return payloadSize.has_value(); }

    // Body accessors with a default for absent or mistyped fields
    std::string getString(const std::string& key, const std::string& fallback = "") const;
    int64_t getInt(const std::string& key, int64_t fallback = 0) const;
    bool getBool(const std::string& key, bool fallback = false) const;

    bool operator==(const Packet& other) const;
    bool operator!=(const Packet& other) const { return !(*this == other); }
};

} // namespace cosmic_connect

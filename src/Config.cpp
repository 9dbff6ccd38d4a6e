#include "Config.hpp"
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>

namespace cosmic_connect {

using json = nlohmann::json;

namespace {
    [[noreturn]] void configError(const std::string& message) {
        throw ProtocolError(ErrorCode::ConfigError, message);
    }

    std::optional<LogLevel> parseLogLevel(const std::string& name) {
        if (name == "debug")    return LogLevel::Debug;
        if (name == "info")     return LogLevel::Info;
        if (name == "warning")  return LogLevel::Warning;
        if (name == "error")    return LogLevel::Error;
        if (name == "security") return LogLevel::Security;
        if (name == "fatal")    return LogLevel::Fatal;
        return std::nullopt;
    }

    const json* findKey(const json& document, const char* key) {
        auto it = document.find(key);
        return it == document.end() ? nullptr : &*it;
    }

    void readString(const json& document, const char* key, std::string& target) {
        if (const json* value = findKey(document, key)) {
            if (!value->is_string()) {
                configError(std::string("'") + key + "' must be a string");
            }
            target = value->get<std::string>();
        }
    }

    void readInt(const json& document, const char* key, int& target, int min, int max) {
        if (const json* value = findKey(document, key)) {
            if (!value->is_number_integer()) {
                configError(std::string("'") + key + "' must be an integer");
            }
            auto number = value->get<int64_t>();
            if (number < min || number > max) {
                configError(std::string("'") + key + "' is out of range");
            }
            target = static_cast<int>(number);
        }
    }

    void readPort(const json& document, const char* key, uint16_t& target) {
        int port = target;
        readInt(document, key, port, 1, 65535);
        target = static_cast<uint16_t>(port);
    }

    void readDuration(const json& document, const char* key, std::chrono::milliseconds& target) {
        int ms = static_cast<int>(target.count());
        readInt(document, key, ms, 1, 24 * 60 * 60 * 1000);
        target = std::chrono::milliseconds(ms);
    }
}

bool Config::validatePort(int port) {
    return port > 0 && port <= 65535;
}

CoreConfig Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        configError("Cannot open config file: " + path);
    }

    json document;
    try {
        document = json::parse(file);
    }
    catch (const json::parse_error& e) {
        configError("Config file is not valid JSON: " + std::string(e.what()));
    }

    CoreConfig config = fromJson(document);
    Logger::logEvent(LogLevel::Info, "Loaded configuration from " + path);
    return config;
}

CoreConfig Config::fromJson(const json& document, CoreConfig base) {
    if (!document.is_object()) {
        configError("Config document must be a JSON object");
    }

    CoreConfig config = std::move(base);

    readString(document, "deviceName", config.deviceName);
    readString(document, "storageDirectory", config.storageDirectory);
    readString(document, "multicastGroup", config.multicastGroup);
    readString(document, "logFile", config.logFile);

    std::string text;
    readString(document, "deviceType", text);
    if (!text.empty()) {
        auto type = parseDeviceType(text);
        if (!type) {
            configError("Unknown deviceType: " + text);
        }
        config.deviceType = *type;
    }

    text.clear();
    readString(document, "logLevel", text);
    if (!text.empty()) {
        auto level = parseLogLevel(text);
        if (!level) {
            configError("Unknown logLevel: " + text);
        }
        config.logLevel = *level;
    }

    readPort(document, "discoveryPort", config.discoveryPort);
    readPort(document, "minControlPort", config.minControlPort);
    readPort(document, "maxControlPort", config.maxControlPort);

    readDuration(document, "broadcastIntervalMs", config.broadcastInterval);
    readDuration(document, "handshakeTimeoutMs", config.handshakeTimeout);
    readDuration(document, "pairingTimeoutMs", config.pairingTimeout);
    readDuration(document, "keepaliveIntervalMs", config.keepaliveInterval);
    readDuration(document, "connectionRateLimitMs", config.connectionRateLimit);

    readInt(document, "discoveryMissedBroadcasts", config.discoveryMissedBroadcasts, 1, 100);
    readInt(document, "keepaliveMissedIntervals", config.keepaliveMissedIntervals, 1, 100);

    validate(config);
    return config;
}

void Config::validate(const CoreConfig& config) {
    if (config.minControlPort > config.maxControlPort) {
        configError("minControlPort exceeds maxControlPort");
    }
    if (config.deviceName.empty()) {
        configError("deviceName must not be empty");
    }
    if (config.multicastGroup.empty()) {
        configError("multicastGroup must not be empty");
    }
    if (config.minControlPort == 0 || config.discoveryPort == 0) {
        configError("Ports must be between 1 and 65535");
    }
    if (config.broadcastInterval.count() <= 0 || config.handshakeTimeout.count() <= 0 ||
        config.pairingTimeout.count() <= 0 || config.keepaliveInterval.count() <= 0) {
        configError("Intervals and timeouts must be positive");
    }
    if (config.discoveryMissedBroadcasts < 1 || config.keepaliveMissedIntervals < 1) {
        configError("Missed interval counts must be at least 1");
    }
}

} // namespace cosmic_connect

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include "Config.hpp"

using namespace cosmic_connect;
using json = nlohmann::json;

namespace {
    ErrorCode configError(const json& document) {
        try {
            Config::fromJson(document);
        }
        catch (const ProtocolError& e) {
            return e.code();
        }
        return ErrorCode::None;
    }
}

TEST(ConfigTest, DefaultsFollowProtocolConstants) {
    CoreConfig config;
    EXPECT_EQ(config.multicastGroup, "224.0.0.251");
    EXPECT_EQ(config.discoveryPort, 1716);
    EXPECT_EQ(config.minControlPort, 1714);
    EXPECT_EQ(config.maxControlPort, 1764);
    EXPECT_EQ(config.broadcastInterval, std::chrono::seconds(5));
    EXPECT_EQ(config.discoveryExpiry(), std::chrono::seconds(15));
    EXPECT_EQ(config.pairingTimeout, std::chrono::seconds(30));
    EXPECT_EQ(config.idleTimeout(), std::chrono::seconds(30));
    EXPECT_NO_THROW(Config::validate(config));
}

TEST(ConfigTest, JsonOverridesNamedValues) {
    json document = {
        {"deviceName", "Laptop"},
        {"deviceType", "laptop"},
        {"discoveryPort", 2716},
        {"broadcastIntervalMs", 1000},
        {"discoveryMissedBroadcasts", 5},
        {"logLevel", "debug"},
        {"somethingElse", true}
    };

    CoreConfig config = Config::fromJson(document);
    EXPECT_EQ(config.deviceName, "Laptop");
    EXPECT_EQ(config.deviceType, DeviceType::Laptop);
    EXPECT_EQ(config.discoveryPort, 2716);
    EXPECT_EQ(config.discoveryExpiry(), std::chrono::seconds(5));
    EXPECT_EQ(config.logLevel, LogLevel::Debug);
    EXPECT_EQ(config.minControlPort, 1714);
}

TEST(ConfigTest, RejectsWrongTypesAndRanges) {
    EXPECT_EQ(configError({{"discoveryPort", "1716"}}), ErrorCode::ConfigError);
    EXPECT_EQ(configError({{"discoveryPort", 70000}}), ErrorCode::ConfigError);
    EXPECT_EQ(configError({{"pairingTimeoutMs", 0}}), ErrorCode::ConfigError);
    EXPECT_EQ(configError({{"deviceType", "fridge"}}), ErrorCode::ConfigError);
    EXPECT_EQ(configError({{"logLevel", "loud"}}), ErrorCode::ConfigError);
    EXPECT_EQ(configError({{"minControlPort", 1800}, {"maxControlPort", 1700}}), ErrorCode::ConfigError);
    EXPECT_EQ(configError(json::array()), ErrorCode::ConfigError);
}

TEST(ConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() /
        ("cosmic_connect_config_" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"deviceName": "From file", "keepaliveIntervalMs": 2000})";
    }

    CoreConfig config = Config::loadFromFile(path.string());
    EXPECT_EQ(config.deviceName, "From file");
    EXPECT_EQ(config.idleTimeout(), std::chrono::seconds(6));
    std::filesystem::remove(path);
}

TEST(ConfigTest, MissingOrBrokenFileIsConfigError) {
    EXPECT_THROW(Config::loadFromFile("/nonexistent/cosmic_connect.json"), ProtocolError);

    auto path = std::filesystem::temp_directory_path() /
        ("cosmic_connect_broken_" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    try {
        Config::loadFromFile(path.string());
        ADD_FAILURE() << "Broken config was accepted";
    }
    catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConfigError);
    }
    std::filesystem::remove(path);
}

TEST(ConfigTest, PortValidation) {
    EXPECT_TRUE(Config::validatePort(1716));
    EXPECT_FALSE(Config::validatePort(0));
    EXPECT_FALSE(Config::validatePort(65536));
}

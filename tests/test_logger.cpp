#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include "Logger.hpp"

using namespace cosmic_connect;

namespace {
    class LoggerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            path_ = std::filesystem::temp_directory_path() /
                ("cosmic_connect_log_" + std::to_string(getpid()) + ".log");
            std::filesystem::remove(path_);
            previous_level_ = Logger::logLevel();
            Logger::enableConsoleOutput(false);
            Logger::setLogFile(path_.string());
        }

        void TearDown() override {
            Logger::setLogFile("");
            Logger::enableConsoleOutput(true);
            Logger::setLogLevel(previous_level_);
            std::filesystem::remove(path_);
        }

        std::string contents() {
            std::ifstream in(path_);
            std::stringstream buffer;
            buffer << in.rdbuf();
            return buffer.str();
        }

        std::filesystem::path path_;
        LogLevel previous_level_ = LogLevel::Info;
    };
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    Logger::setLogLevel(LogLevel::Warning);
    EXPECT_EQ(Logger::logLevel(), LogLevel::Warning);

    Logger::logEvent(LogLevel::Info, "quiet line");
    Logger::logEvent(LogLevel::Security, "loud line");

    std::string log = contents();
    EXPECT_EQ(log.find("quiet line"), std::string::npos);
    EXPECT_NE(log.find("[SECURITY]"), std::string::npos);
    EXPECT_NE(log.find("loud line"), std::string::npos);
}

TEST_F(LoggerTest, PacketLinesNameDeviceAndType) {
    Logger::setLogLevel(LogLevel::Debug);
    Logger::logPacket(LogLevel::Info, "phone", "cconnect.ping", "Sent");
    Logger::logPacket(LogLevel::Info, "", "", "No context");

    std::string log = contents();
    EXPECT_NE(log.find("device=phone type=cconnect.ping: Sent"), std::string::npos);
    EXPECT_NE(log.find("device=- type=-: No context"), std::string::npos);
}

TEST_F(LoggerTest, ErrorsCarryTheirCode) {
    Logger::logError(ErrorCode::PairingTimeout, "no answer");

    std::string log = contents();
    EXPECT_NE(log.find("Code: PairingTimeout"), std::string::npos);
    EXPECT_NE(log.find("no answer"), std::string::npos);
}

#pragma once

#include <string>
#include <mutex>
#include <string_view>
#include "CoreTypes.hpp"

namespace cosmic_connect {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Security,
    Fatal
};

class Logger {
public:
    static void logEvent(LogLevel level, std::string_view message);
    static void logError(ErrorCode code, std::string_view details);

    // Records device and packet type only; packet bodies are never logged
    static void logPacket(LogLevel level, std::string_view deviceId,
        std::string_view packetType, std::string_view message);

    static void setLogLevel(LogLevel minLevel);
    static LogLevel logLevel();
    static void setLogFile(std::string_view path);
    static void enableConsoleOutput(bool enable);

    static void flush();

private:
    static std::mutex log_mutex_;
    static LogLevel min_log_level_;
    static std::string log_file_path_;
    static bool console_output_enabled_;

    static void write(std::string_view line);
    static void writeToFile(std::string_view message);

    Logger() = delete;
    ~Logger() = delete;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

} // namespace cosmic_connect

#include "ConnectCore.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace cosmic_connect {

namespace {
    constexpr const char* PACKET_TYPE_PING = "cconnect.ping";

    std::atomic<bool> shutdownRequested{false};
    std::mutex cleanup_mutex;
    bool cleanup_performed{false};

    void signalHandler(int) {
        shutdownRequested = true;
    }

    // Answers every ping with a ping carrying the original id
    class PingHandler : public PacketHandler {
    public:
        explicit PingHandler(ConnectCore& core) : core_(core) {}

        void handlePacket(const std::string& deviceId, const Packet& packet) override {
            if (packet.getBool("reply")) {
                Logger::logPacket(LogLevel::Info, deviceId, packet.type, "Pong received");
                return;
            }
            Logger::logPacket(LogLevel::Info, deviceId, packet.type, "Ping received");
            core_.send(deviceId, Packet::create(PACKET_TYPE_PING, {
                {"reply", true},
                {"replyTo", packet.id}
            }));
        }

        void onConnected(const std::string& deviceId) override {
            core_.send(deviceId, Packet::create(PACKET_TYPE_PING));
        }

        std::vector<std::string> outgoingCapabilities() const override {
            return {PACKET_TYPE_PING};
        }

    private:
        ConnectCore& core_;
    };

    void performCleanup(ConnectCore* core) {
        std::lock_guard<std::mutex> lock(cleanup_mutex);
        if (!cleanup_performed) {
            try {
                if (core) {
                    core->stop();
                }
                Logger::flush();
                cleanup_performed = true;
            }
            catch (const std::exception& e) {
                Logger::logError(ErrorCode::NetworkError,
                    std::string("Cleanup failed: ") + e.what());
            }
        }
    }

    std::string defaultStorageDirectory() {
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
            return std::string(xdg) + "/cosmic-connect";
        }
        if (const char* home = std::getenv("HOME"); home && *home) {
            return std::string(home) + "/.config/cosmic-connect";
        }
        return "cosmic-connect";
    }

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " [options]\n"
                  << "  --config <file>     JSON configuration\n"
                  << "  --name <name>       Device name\n"
                  << "  --port <port>       Fixed control port\n"
                  << "  --storage <dir>     Certificate and trust storage\n"
                  << "  --log-file <file>   Append log lines to a file\n"
                  << "  --accept-pairing    Accept every pair request\n"
                  << "  --verbose           Debug logging\n";
    }
}

} // namespace cosmic_connect

constexpr uint16_t MIN_PORT = 1024;
constexpr uint16_t MAX_PORT = 65535;

uint16_t validatePort(const std::string& port_str) {
    int port = 0;
    try {
        port = std::stoi(port_str);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Invalid port number: " + port_str);
    }
    if (port < MIN_PORT || port > MAX_PORT) {
        throw std::runtime_error("Port must be between 1024 and 65535");
    }
    return static_cast<uint16_t>(port);
}

int main(int argc, char* argv[]) {
    using namespace cosmic_connect;

    std::unique_ptr<ConnectCore> core;
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        Logger::setLogLevel(LogLevel::Info);
        Logger::enableConsoleOutput(true);

        std::string configPath;
        std::optional<std::string> name;
        std::optional<uint16_t> port;
        std::optional<std::string> storage;
        std::optional<std::string> logFile;
        bool verbose = false;
        bool acceptPairing = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--config") {
                configPath = value();
            } else if (arg == "--name") {
                name = value();
            } else if (arg == "--port") {
                port = validatePort(value());
            } else if (arg == "--storage") {
                storage = value();
            } else if (arg == "--log-file") {
                logFile = value();
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--accept-pairing") {
                acceptPairing = true;
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 2;
            }
        }

        CoreConfig config = configPath.empty() ? CoreConfig{} : Config::loadFromFile(configPath);
        if (name) {
            config.deviceName = *name;
        }
        if (port) {
            config.minControlPort = *port;
            config.maxControlPort = *port;
        }
        if (storage) {
            config.storageDirectory = *storage;
        }
        if (config.storageDirectory.empty()) {
            config.storageDirectory = defaultStorageDirectory();
        }
        if (logFile) {
            config.logFile = *logFile;
        }
        if (verbose) {
            config.logLevel = LogLevel::Debug;
        }
        Config::validate(config);

        Logger::setLogLevel(config.logLevel);
        if (!config.logFile.empty()) {
            Logger::setLogFile(config.logFile);
        }
        Logger::logEvent(LogLevel::Info, "cosmic-connectd starting as " + config.deviceName);

        core = std::make_unique<ConnectCore>(config);
        core->registerHandler(PACKET_TYPE_PING, std::make_shared<PingHandler>(*core));

        ConnectCore* corePtr = core.get();
        core->setPairRequestHandler([corePtr, acceptPairing](const PairingRequest& request) {
            Logger::logEvent(LogLevel::Info, "Pair request from " + request.deviceName + " (" +
                request.deviceId + "), verification key " + request.verificationKey);
            if (acceptPairing) {
                corePtr->acceptPairing(request.deviceId);
            } else {
                corePtr->rejectPairing(request.deviceId);
            }
        });

        if (!core->start()) {
            throw std::runtime_error("Failed to start the core");
        }

        DiscoveryCallbacks callbacks;
        callbacks.onDeviceFound = [](const DeviceIdentity& identity, const std::string& address) {
            Logger::logEvent(LogLevel::Info, "Found " + identity.deviceName + " (" +
                identity.deviceId + ") at " + address + ":" + std::to_string(identity.tcpPort));
        };
        callbacks.onDeviceLost = [](const std::string& deviceId) {
            Logger::logEvent(LogLevel::Info, "Lost " + deviceId);
        };
        if (!core->startDiscovery(callbacks)) {
            Logger::logEvent(LogLevel::Warning, "Discovery unavailable, accepting direct connections only");
        }

        while (!shutdownRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        Logger::logEvent(LogLevel::Info, "Shutdown requested");

        performCleanup(core.get());
        return 0;
    }
    catch (const std::exception& e) {
        Logger::logError(ErrorCode::ConfigError, std::string("Fatal error: ") + e.what());
        performCleanup(core.get());
        return 1;
    }
}

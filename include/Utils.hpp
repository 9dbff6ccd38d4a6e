#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <shared_mutex>

namespace cosmic_connect {

class Utils {
public:
    // Random device id: 32 lower-case hex characters
    static std::string generateDeviceId();

    // Timestamp utilities
    static int64_t currentTimestampMs();

    static std::string toHex(const std::vector<uint8_t>& data, bool upperCase = true);
    static std::string trim(const std::string& value);

    // Identifier made only of [A-Za-z0-9_-], 1 to maxLength characters
    static bool isValidIdentifier(const std::string& value, size_t maxLength);

private:
    static constexpr size_t DEVICE_ID_BYTES = 16;

    Utils() = delete;
};

// Drops repeated events for the same key arriving within a window.
class RateLimiter {
public:
    explicit RateLimiter(std::chrono::milliseconds window, size_t maxEntries = 255);

    // True when the event must be discarded
    bool shouldDrop(const std::string& key,
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

private:
    std::chrono::milliseconds window_;
    size_t max_entries_;
    std::shared_mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_seen_;
};

// Hands out one mutex per key so work on different devices never contends.
// Callers keep the returned handle while locked; entries nobody holds are
// dropped once the map grows past the prune threshold.
class KeyedMutex {
public:
    explicit KeyedMutex(size_t pruneThreshold = 64);

    std::shared_ptr<std::mutex> get(const std::string& key);
    size_t size();

private:
    void pruneUnused();

    size_t prune_threshold_;
    std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace cosmic_connect

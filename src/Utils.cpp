#include "Utils.hpp"
#include "Crypto.hpp"
#include <algorithm>
#include <cctype>

namespace cosmic_connect {

std::string Utils::generateDeviceId() {
    // Lower-case keeps ids stable under case-insensitive comparison on peers
    return toHex(Crypto::randomBytes(DEVICE_ID_BYTES), false);
}

int64_t Utils::currentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string Utils::toHex(const std::vector<uint8_t>& data, bool upperCase) {
    static constexpr char UPPER[] = "0123456789ABCDEF";
    static constexpr char LOWER[] = "0123456789abcdef";
    const char* digits = upperCase ? UPPER : LOWER;

    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result.push_back(digits[byte >> 4]);
        result.push_back(digits[byte & 0x0F]);
    }
    return result;
}

std::string Utils::trim(const std::string& value) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), isSpace);
    auto end = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

bool Utils::isValidIdentifier(const std::string& value, size_t maxLength) {
    if (value.empty() || value.size() > maxLength) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

RateLimiter::RateLimiter(std::chrono::milliseconds window, size_t maxEntries)
    : window_(window), max_entries_(maxEntries) {}

bool RateLimiter::shouldDrop(const std::string& key, std::chrono::steady_clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = last_seen_.find(key);
    if (it != last_seen_.end() && it->second + window_ > now) {
        return true;
    }
    last_seen_[key] = now;

    // Periodically forget entries whose window has passed
    if (last_seen_.size() > max_entries_) {
        for (auto entry = last_seen_.begin(); entry != last_seen_.end();) {
            if (entry->second + window_ < now) {
                entry = last_seen_.erase(entry);
            } else {
                ++entry;
            }
        }
    }
    return false;
}

KeyedMutex::KeyedMutex(size_t pruneThreshold)
    : prune_threshold_(pruneThreshold) {}

std::shared_ptr<std::mutex> KeyedMutex::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    if (mutexes_.size() >= prune_threshold_) {
        pruneUnused();
    }
    auto& slot = mutexes_[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

size_t KeyedMutex::size() {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return mutexes_.size();
}

void KeyedMutex::pruneUnused() {
    // use_count() == 1: only the map refers to it, so nobody can hold the lock
    for (auto it = mutexes_.begin(); it != mutexes_.end();) {
        if (it->second.use_count() == 1) {
            it = mutexes_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace cosmic_connect

#include "CertificateStorage.hpp"
#include "CoreTypes.hpp"
#include "Logger.hpp"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cosmic_connect {

namespace fs = std::filesystem;

namespace {
    constexpr mode_t FILE_MODE = 0600;

    [[noreturn]] void storageError(const std::string& message) {
        throw ProtocolError(ErrorCode::StorageError, message);
    }

    // Keys are relative paths of [A-Za-z0-9_.-] segments separated by '/'
    bool isValidKey(const std::string& key) {
        if (key.empty() || key.front() == '/' || key.back() == '/') {
            return false;
        }
        size_t start = 0;
        while (start <= key.size()) {
            size_t end = key.find('/', start);
            if (end == std::string::npos) end = key.size();
            std::string segment = key.substr(start, end - start);
            if (segment.empty() || segment == "." || segment == "..") {
                return false;
            }
            for (unsigned char c : segment) {
                if (!std::isalnum(c) && c != '_' && c != '-' && c != '.') {
                    return false;
                }
            }
            start = end + 1;
        }
        return true;
    }

    void writeAll(int fd, const std::vector<uint8_t>& bytes, const std::string& path) {
        size_t written = 0;
        while (written < bytes.size()) {
            ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                storageError("Failed to write " + path + ": " + std::strerror(errno));
            }
            written += static_cast<size_t>(n);
        }
    }
}

FileCertificateStorage::FileCertificateStorage(std::string directory)
    : directory_(std::move(directory)) {
    if (directory_.empty()) {
        storageError("Storage directory must not be empty");
    }
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        storageError("Cannot create storage directory " + directory_ + ": " + ec.message());
    }
    fs::permissions(directory_, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        Logger::logEvent(LogLevel::Warning,
            "Cannot restrict permissions of " + directory_ + ": " + ec.message());
    }
}

std::string FileCertificateStorage::pathFor(const std::string& key) const {
    if (!isValidKey(key)) {
        storageError("Invalid storage key: " + key);
    }
    return (fs::path(directory_) / key).string();
}

void FileCertificateStorage::store(const std::string& key, const std::vector<uint8_t>& bytes) {
    std::string path = pathFor(key);
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        storageError("Cannot create directory for " + path + ": " + ec.message());
    }

    // Write to a sibling file and rename so readers never see a partial value
    std::string tmpPath = path + ".tmp";
    int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, FILE_MODE);
    if (fd < 0) {
        storageError("Cannot open " + tmpPath + ": " + std::strerror(errno));
    }
    try {
        writeAll(fd, bytes, tmpPath);
        if (::fsync(fd) < 0) {
            storageError("Failed to sync " + tmpPath + ": " + std::strerror(errno));
        }
    }
    catch (const ProtocolError&) {
        ::close(fd);
        ::unlink(tmpPath.c_str());
        throw;
    }
    ::close(fd);

    if (::rename(tmpPath.c_str(), path.c_str()) < 0) {
        int err = errno;
        ::unlink(tmpPath.c_str());
        storageError("Cannot replace " + path + ": " + std::strerror(err));
    }
}

std::optional<std::vector<uint8_t>> FileCertificateStorage::load(const std::string& key) {
    std::string path = pathFor(key);
    std::lock_guard<std::mutex> lock(mutex_);

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return std::nullopt;
        }
        storageError("Cannot open " + path + ": " + std::strerror(errno));
    }

    std::vector<uint8_t> bytes;
    uint8_t buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            storageError("Failed to read " + path + ": " + std::strerror(err));
        }
        if (n == 0) break;
        bytes.insert(bytes.end(), buffer, buffer + n);
    }
    ::close(fd);
    return bytes;
}

void FileCertificateStorage::remove(const std::string& key) {
    std::string path = pathFor(key);
    std::lock_guard<std::mutex> lock(mutex_);

    if (::unlink(path.c_str()) < 0 && errno != ENOENT) {
        storageError("Cannot remove " + path + ": " + std::strerror(errno));
    }
}

void MemoryStorage::store(const std::string& key, const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = bytes;
}

std::optional<std::vector<uint8_t>> MemoryStorage::load(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStorage::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
}

size_t MemoryStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace cosmic_connect

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cosmic_connect {

// Key/value store for certificates, keys and trust records. Platform layers
// substitute their secure keystore here. Implementations must be thread-safe
// and throw ProtocolError(StorageError) on failure.
class CertificateStorage {
public:
    virtual ~CertificateStorage() = default;

    virtual void store(const std::string& key, const std::vector<uint8_t>& bytes) = 0;
    virtual std::optional<std::vector<uint8_t>> load(const std::string& key) = 0;
    virtual void remove(const std::string& key) = 0;
};

// One file per key below a directory, readable by the owner only
class FileCertificateStorage : public CertificateStorage {
public:
    explicit FileCertificateStorage(std::string directory);

    void store(const std::string& key, const std::vector<uint8_t>& bytes) override;
    std::optional<std::vector<uint8_t>> load(const std::string& key) override;
    void remove(const std::string& key) override;

    const std::string& directory() const { return directory_; }

private:
    std::string pathFor(const std::string& key) const;

    std::string directory_;
    std::mutex mutex_;
};

class MemoryStorage : public CertificateStorage {
public:
    void store(const std::string& key, const std::vector<uint8_t>& bytes) override;
    std::optional<std::vector<uint8_t>> load(const std::string& key) override;
    void remove(const std::string& key) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<uint8_t>> entries_;
};

} // namespace cosmic_connect

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "CertificateStorage.hpp"

namespace cosmic_connect {

// Long-lived self-signed identity certificate of the local device
struct Certificate {
    std::string deviceId;
    std::string certificatePem;
    std::string privateKeyPem;
    std::vector<uint8_t> der;
    std::string fingerprint;
    std::chrono::system_clock::time_point notAfter;
};

class CertificateManager {
public:
    static constexpr const char* KEY_CERTIFICATE = "local_certificate";
    static constexpr const char* KEY_PRIVATE_KEY = "local_private_key";
    static constexpr const char* KEY_DEVICE_ID = "device_id";

    explicit CertificateManager(std::shared_ptr<CertificateStorage> storage);

    CertificateManager(const CertificateManager&) = delete;
    CertificateManager& operator=(const CertificateManager&) = delete;

    // Cached after the first call. A stored pair is reused unless it is
    // expired, unreadable or not bound to the persisted device id.
    std::shared_ptr<const Certificate> getOrCreateLocalCertificate();

    // Explicit rotation: new key and certificate for the same device id
    std::shared_ptr<const Certificate> regenerateLocalCertificate();

    std::string deviceId();

    // Upper-case hex SHA-256 of the DER encoding
    static std::string fingerprint(const std::vector<uint8_t>& der);
    static std::string fingerprintFromPem(const std::string& pem);

    // "AB:CD:..." for display
    static std::string formatFingerprint(const std::string& fingerprint);

    // Short code shown on both devices during pairing; symmetric in its
    // arguments
    static std::string verificationKey(const std::string& fingerprintA,
        const std::string& fingerprintB);

private:
    static constexpr size_t VERIFICATION_KEY_LENGTH = 8;

    std::string loadOrCreateDeviceId();
    std::shared_ptr<const Certificate> loadStored(const std::string& deviceId);
    std::shared_ptr<const Certificate> generateAndStore(const std::string& deviceId);
    static std::shared_ptr<const Certificate> makeCertificate(
        const std::string& deviceId, std::string certificatePem, std::string privateKeyPem);

    std::shared_ptr<CertificateStorage> storage_;
    std::mutex mutex_;
    std::shared_ptr<const Certificate> cached_;
};

} // namespace cosmic_connect

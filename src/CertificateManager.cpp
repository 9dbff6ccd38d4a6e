#include "CertificateManager.hpp"
#include "Crypto.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"
#include "Utils.hpp"
#include <algorithm>

namespace cosmic_connect {

namespace {
    std::vector<uint8_t> toBytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::string toText(std::vector<uint8_t>& bytes) {
        std::string text(bytes.begin(), bytes.end());
        Crypto::secureWipe(bytes);
        return text;
    }
}

CertificateManager::CertificateManager(std::shared_ptr<CertificateStorage> storage)
    : storage_(std::move(storage)) {
    if (!storage_) {
        throw ProtocolError(ErrorCode::InvalidParameter, "Certificate storage is required");
    }
}

std::shared_ptr<const Certificate> CertificateManager::getOrCreateLocalCertificate() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (cached_ && cached_->notAfter > std::chrono::system_clock::now()) {
        return cached_;
    }

    std::string deviceId = loadOrCreateDeviceId();
    auto certificate = loadStored(deviceId);
    if (!certificate) {
        certificate = generateAndStore(deviceId);
    }
    cached_ = certificate;
    return cached_;
}

std::shared_ptr<const Certificate> CertificateManager::regenerateLocalCertificate() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string deviceId = loadOrCreateDeviceId();
    Logger::logEvent(LogLevel::Security, "Rotating local certificate on request");
    cached_ = generateAndStore(deviceId);
    return cached_;
}

std::string CertificateManager::deviceId() {
    return getOrCreateLocalCertificate()->deviceId;
}

std::string CertificateManager::loadOrCreateDeviceId() {
    if (auto stored = storage_->load(KEY_DEVICE_ID)) {
        std::string id(stored->begin(), stored->end());
        if (Utils::isValidIdentifier(id, protocol::MAX_DEVICE_ID_LENGTH)) {
            return id;
        }
        Logger::logEvent(LogLevel::Security, "Stored device id is invalid, creating a new one");
    } else if (auto pem = storage_->load(KEY_CERTIFICATE)) {
        // Adopt the id a previously stored certificate was issued for
        try {
            std::string id = Crypto::certificateCommonName(std::string(pem->begin(), pem->end()));
            if (Utils::isValidIdentifier(id, protocol::MAX_DEVICE_ID_LENGTH)) {
                storage_->store(KEY_DEVICE_ID, toBytes(id));
                return id;
            }
        }
        catch (const ProtocolError& e) {
            Logger::logEvent(LogLevel::Warning,
                std::string("Stored certificate is unreadable: ") + e.what());
        }
    }

    std::string id = Utils::generateDeviceId();
    storage_->store(KEY_DEVICE_ID, toBytes(id));
    Logger::logEvent(LogLevel::Info, "Created device id " + id);
    return id;
}

std::shared_ptr<const Certificate> CertificateManager::loadStored(const std::string& deviceId) {
    auto certBytes = storage_->load(KEY_CERTIFICATE);
    auto keyBytes = storage_->load(KEY_PRIVATE_KEY);
    if (!certBytes || !keyBytes) {
        if (certBytes || keyBytes) {
            Logger::logEvent(LogLevel::Security,
                "Stored certificate or key is missing its counterpart, regenerating");
        }
        return nullptr;
    }

    std::string certificatePem(certBytes->begin(), certBytes->end());
    std::string privateKeyPem = toText(*keyBytes);

    try {
        auto certificate = makeCertificate(deviceId, certificatePem, privateKeyPem);

        if (Crypto::certificateCommonName(certificatePem) != deviceId) {
            Logger::logEvent(LogLevel::Security,
                "Stored certificate is not issued for device " + deviceId + ", regenerating");
            return nullptr;
        }
        if (!Crypto::privateKeyMatches(certificatePem, privateKeyPem)) {
            Logger::logEvent(LogLevel::Security,
                "Stored private key does not match the certificate, regenerating");
            return nullptr;
        }
        if (certificate->notAfter <= std::chrono::system_clock::now()) {
            Logger::logEvent(LogLevel::Security, "Local certificate expired, regenerating");
            return nullptr;
        }

        Logger::logEvent(LogLevel::Info, "Loaded local certificate " +
            formatFingerprint(certificate->fingerprint));
        return certificate;
    }
    catch (const ProtocolError& e) {
        Logger::logEvent(LogLevel::Security,
            std::string("Stored certificate is corrupt, regenerating: ") + e.what());
        return nullptr;
    }
}

std::shared_ptr<const Certificate> CertificateManager::generateAndStore(const std::string& deviceId) {
    CertificateMaterial material = Crypto::generateSelfSignedCertificate(
        deviceId,
        protocol::CERTIFICATE_ORGANIZATION,
        protocol::CERTIFICATE_VALIDITY_DAYS,
        protocol::CERTIFICATE_KEY_BITS);

    std::vector<uint8_t> keyBytes = toBytes(material.privateKeyPem);
    storage_->store(KEY_PRIVATE_KEY, keyBytes);
    Crypto::secureWipe(keyBytes);
    storage_->store(KEY_CERTIFICATE, toBytes(material.certificatePem));

    auto certificate = makeCertificate(deviceId,
        std::move(material.certificatePem), std::move(material.privateKeyPem));
    Logger::logEvent(LogLevel::Security, "New local certificate " +
        formatFingerprint(certificate->fingerprint));
    return certificate;
}

std::shared_ptr<const Certificate> CertificateManager::makeCertificate(
    const std::string& deviceId, std::string certificatePem, std::string privateKeyPem)
{
    auto certificate = std::make_shared<Certificate>();
    certificate->deviceId = deviceId;
    certificate->der = Crypto::certificatePemToDer(certificatePem);
    certificate->fingerprint = fingerprint(certificate->der);
    certificate->notAfter = Crypto::certificateNotAfter(certificatePem);
    certificate->certificatePem = std::move(certificatePem);
    certificate->privateKeyPem = std::move(privateKeyPem);
    return certificate;
}

std::string CertificateManager::fingerprint(const std::vector<uint8_t>& der) {
    return Utils::toHex(Crypto::sha256(der));
}

std::string CertificateManager::fingerprintFromPem(const std::string& pem) {
    return fingerprint(Crypto::certificatePemToDer(pem));
}

std::string CertificateManager::formatFingerprint(const std::string& fingerprint) {
    std::string result;
    result.reserve(fingerprint.size() + fingerprint.size() / 2);
    for (size_t i = 0; i < fingerprint.size(); ++i) {
        if (i > 0 && i % 2 == 0) {
            result.push_back(':');
        }
        result.push_back(fingerprint[i]);
    }
    return result;
}

std::string CertificateManager::verificationKey(const std::string& fingerprintA,
    const std::string& fingerprintB)
{
    const std::string& low = std::min(fingerprintA, fingerprintB);
    const std::string& high = std::max(fingerprintA, fingerprintB);
    std::string digest = Utils::toHex(Crypto::sha256(low + high));
    return digest.substr(0, VERIFICATION_KEY_LENGTH);
}

} // namespace cosmic_connect

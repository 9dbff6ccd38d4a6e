#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>
#include "CoreTypes.hpp"

namespace cosmic_connect {

// PEM encoded certificate and its private key
struct CertificateMaterial {
    std::string certificatePem;
    std::string privateKeyPem;
};

class Crypto {
public:
    // Hashing
    static std::vector<uint8_t> sha256(std::string_view data);
    static std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

    static std::vector<uint8_t> randomBytes(size_t count);

    // Self-signed X.509 certificate over a fresh RSA key, SHA-256 signature
    static CertificateMaterial generateSelfSignedCertificate(
        const std::string& commonName,
        const std::string& organization,
        int validityDays,
        int keyBits);

    // Certificate inspection; all throw ProtocolError(CertificateError)
    // when the input does not parse
    static std::vector<uint8_t> certificatePemToDer(const std::string& pem);
    static std::string certificateCommonName(const std::string& pem);
    static std::string certificateCommonName(const std::vector<uint8_t>& der);
    static std::chrono::system_clock::time_point certificateNotAfter(const std::string& pem);
    static bool privateKeyMatches(const std::string& certificatePem,
        const std::string& privateKeyPem);

    // Secure memory wiping
    static void secureWipe(std::vector<uint8_t>& data);
    static void secureWipe(std::string& data);

    // Drains the OpenSSL error queue into a ProtocolError
    [[noreturn]] static void throwOpenSSLError(const std::string& operation,
        ErrorCode code = ErrorCode::CertificateError);

private:
    static constexpr long SERIAL_BYTES = 8;

    // Prevent instantiation
    Crypto() = delete;
    ~Crypto() = delete;
    Crypto(const Crypto&) = delete;
    Crypto& operator=(const Crypto&) = delete;
};

} // namespace cosmic_connect

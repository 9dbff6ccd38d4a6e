#include "Crypto.hpp"
#include "Logger.hpp"
#include <ctime>
#include <memory>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace cosmic_connect {

namespace {
    struct BIODeleter {
        void operator()(BIO* bio) { BIO_free_all(bio); }
    };
    using BIOPtr = std::unique_ptr<BIO, BIODeleter>;

    struct X509Deleter {
        void operator()(X509* cert) { X509_free(cert); }
    };
    using X509Ptr = std::unique_ptr<X509, X509Deleter>;

    class ScopedEVP_PKEY {
    public:
        ScopedEVP_PKEY(EVP_PKEY* key = nullptr) : key_(key) {}
        ~ScopedEVP_PKEY() { EVP_PKEY_free(key_); }
        EVP_PKEY* get() { return key_; }
        EVP_PKEY** ptr() { return &key_; }
    private:
        EVP_PKEY* key_;
    };

    class ScopedEVP_PKEY_CTX {
    public:
        explicit ScopedEVP_PKEY_CTX(EVP_PKEY_CTX* ctx) : ctx_(ctx) {
            if (!ctx_) Crypto::throwOpenSSLError("EVP_PKEY_CTX_new_id");
        }
        ~ScopedEVP_PKEY_CTX() { EVP_PKEY_CTX_free(ctx_); }
        EVP_PKEY_CTX* get() { return ctx_; }
    private:
        EVP_PKEY_CTX* ctx_;
    };

    class ScopedEVP_MD_CTX {
    public:
        ScopedEVP_MD_CTX() : ctx_(EVP_MD_CTX_new()) {
            if (!ctx_) Crypto::throwOpenSSLError("EVP_MD_CTX_new");
        }
        ~ScopedEVP_MD_CTX() { EVP_MD_CTX_free(ctx_); }
        EVP_MD_CTX* get() { return ctx_; }
    private:
        EVP_MD_CTX* ctx_;
    };

    std::string bioToString(BIO* bio) {
        char* data = nullptr;
        long len = BIO_get_mem_data(bio, &data);
        if (len <= 0 || !data) {
            return {};
        }
        return std::string(data, static_cast<size_t>(len));
    }

    X509Ptr parseCertificate(const std::string& pem) {
        BIOPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if (!bio) Crypto::throwOpenSSLError("BIO_new_mem_buf");

        X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!cert) Crypto::throwOpenSSLError("PEM_read_bio_X509");
        return cert;
    }

    void addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
        if (!X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                reinterpret_cast<const unsigned char*>(value.c_str()), -1, -1, 0)) {
            Crypto::throwOpenSSLError("X509_NAME_add_entry_by_txt");
        }
    }
}

void Crypto::throwOpenSSLError(const std::string& operation, ErrorCode code) {
    std::string error;
    while (unsigned long err = ERR_get_error()) {
        char err_buf[256];
        ERR_error_string_n(err, err_buf, sizeof(err_buf));
        if (!error.empty()) error += "; ";
        error += err_buf;
    }
    if (error.empty()) {
        error = "no OpenSSL error recorded";
    }
    throw ProtocolError(code, operation + " failed: " + error);
}

std::vector<uint8_t> Crypto::sha256(std::string_view data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    ScopedEVP_MD_CTX ctx;
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
        throwOpenSSLError("EVP_DigestInit_ex");
    }
    if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
        throwOpenSSLError("EVP_DigestUpdate");
    }
    if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
        throwOpenSSLError("EVP_DigestFinal_ex");
    }
    return std::vector<uint8_t>(hash, hash + hash_len);
}

std::vector<uint8_t> Crypto::sha256(const std::vector<uint8_t>& data) {
    return sha256(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

std::vector<uint8_t> Crypto::randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throwOpenSSLError("RAND_bytes");
    }
    return bytes;
}

CertificateMaterial Crypto::generateSelfSignedCertificate(
    const std::string& commonName,
    const std::string& organization,
    int validityDays,
    int keyBits)
{
    try {
        // RSA key pair
        ScopedEVP_PKEY pkey;
        {
            ScopedEVP_PKEY_CTX pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
            if (EVP_PKEY_keygen_init(pctx.get()) <= 0)
                throwOpenSSLError("EVP_PKEY_keygen_init");
            if (EVP_PKEY_CTX_set_rsa_keygen_bits(pctx.get(), keyBits) <= 0)
                throwOpenSSLError("EVP_PKEY_CTX_set_rsa_keygen_bits");
            if (EVP_PKEY_keygen(pctx.get(), pkey.ptr()) <= 0)
                throwOpenSSLError("EVP_PKEY_keygen");
        }

        X509Ptr cert(X509_new());
        if (!cert) throwOpenSSLError("X509_new");

        if (!X509_set_version(cert.get(), 2)) throwOpenSSLError("X509_set_version");

        // Random positive serial
        {
            std::vector<uint8_t> serialBytes = randomBytes(SERIAL_BYTES);
            serialBytes[0] &= 0x7F;
            BIGNUM* bn = BN_bin2bn(serialBytes.data(), static_cast<int>(serialBytes.size()), nullptr);
            if (!bn) throwOpenSSLError("BN_bin2bn");
            ASN1_INTEGER* serial = BN_to_ASN1_INTEGER(bn, X509_get_serialNumber(cert.get()));
            BN_free(bn);
            if (!serial) throwOpenSSLError("BN_to_ASN1_INTEGER");
        }

        if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
            !X509_gmtime_adj(X509_getm_notAfter(cert.get()),
                static_cast<long>(validityDays) * 24 * 60 * 60)) {
            throwOpenSSLError("X509_gmtime_adj");
        }

        X509_NAME* name = X509_get_subject_name(cert.get());
        addNameEntry(name, "CN", commonName);
        addNameEntry(name, "O", organization);
        if (!X509_set_issuer_name(cert.get(), name)) throwOpenSSLError("X509_set_issuer_name");

        if (!X509_set_pubkey(cert.get(), pkey.get())) throwOpenSSLError("X509_set_pubkey");
        if (X509_sign(cert.get(), pkey.get(), EVP_sha256()) <= 0) throwOpenSSLError("X509_sign");

        CertificateMaterial material;

        BIOPtr certBio(BIO_new(BIO_s_mem()));
        if (!certBio || !PEM_write_bio_X509(certBio.get(), cert.get())) {
            throwOpenSSLError("PEM_write_bio_X509");
        }
        material.certificatePem = bioToString(certBio.get());

        BIOPtr keyBio(BIO_new(BIO_s_mem()));
        if (!keyBio || !PEM_write_bio_PrivateKey(keyBio.get(), pkey.get(),
                nullptr, nullptr, 0, nullptr, nullptr)) {
            throwOpenSSLError("PEM_write_bio_PrivateKey");
        }
        material.privateKeyPem = bioToString(keyBio.get());

        Logger::logEvent(LogLevel::Security, "Generated self-signed certificate for " + commonName);
        return material;
    }
    catch (const std::exception& e) {
        Logger::logError(ErrorCode::CertificateError,
            std::string("Failed to generate certificate: ") + e.what());
        throw;
    }
}

std::vector<uint8_t> Crypto::certificatePemToDer(const std::string& pem) {
    X509Ptr cert = parseCertificate(pem);

    int len = i2d_X509(cert.get(), nullptr);
    if (len <= 0) throwOpenSSLError("i2d_X509");

    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* out = der.data();
    if (i2d_X509(cert.get(), &out) != len) throwOpenSSLError("i2d_X509");
    return der;
}

namespace {
    std::string commonNameOf(X509* cert) {
        X509_NAME* name = X509_get_subject_name(cert);
        int index = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
        if (index < 0) {
            return {};
        }

        ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, index));
        unsigned char* utf8 = nullptr;
        int len = ASN1_STRING_to_UTF8(&utf8, data);
        if (len < 0) Crypto::throwOpenSSLError("ASN1_STRING_to_UTF8");

        std::string result(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
        OPENSSL_free(utf8);
        return result;
    }
}

std::string Crypto::certificateCommonName(const std::string& pem) {
    X509Ptr cert = parseCertificate(pem);
    return commonNameOf(cert.get());
}

std::string Crypto::certificateCommonName(const std::vector<uint8_t>& der) {
    const unsigned char* in = der.data();
    X509Ptr cert(d2i_X509(nullptr, &in, static_cast<long>(der.size())));
    if (!cert) {
        throwOpenSSLError("d2i_X509", ErrorCode::CertificateError);
    }
    return commonNameOf(cert.get());
}

std::chrono::system_clock::time_point Crypto::certificateNotAfter(const std::string& pem) {
    X509Ptr cert = parseCertificate(pem);

    std::tm tm_buf{};
    if (!ASN1_TIME_to_tm(X509_get0_notAfter(cert.get()), &tm_buf)) {
        throwOpenSSLError("ASN1_TIME_to_tm");
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm_buf));
}

bool Crypto::privateKeyMatches(const std::string& certificatePem, const std::string& privateKeyPem) {
    X509Ptr cert = parseCertificate(certificatePem);

    BIOPtr bio(BIO_new_mem_buf(privateKeyPem.data(), static_cast<int>(privateKeyPem.size())));
    if (!bio) throwOpenSSLError("BIO_new_mem_buf");

    ScopedEVP_PKEY key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key.get()) throwOpenSSLError("PEM_read_bio_PrivateKey");

    bool matches = X509_check_private_key(cert.get(), key.get()) == 1;
    ERR_clear_error();
    return matches;
}

void Crypto::secureWipe(std::vector<uint8_t>& data) {
    if (data.empty()) return;

    // Use OpenSSL's secure memory wiping function
    OPENSSL_cleanse(data.data(), data.size());
    data.clear();
    data.shrink_to_fit();
}

void Crypto::secureWipe(std::string& data) {
    if (data.empty()) return;

    OPENSSL_cleanse(data.data(), data.size());
    data.clear();
    data.shrink_to_fit();
}

} // namespace cosmic_connect

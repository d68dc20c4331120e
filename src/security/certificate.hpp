#pragma once

#include <string>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace deskstream {

// Owns an X509 certificate and its private key.
class Certificate {
public:
    Certificate() = default;
    ~Certificate();

    Certificate(const Certificate&) = delete;
    Certificate& operator=(const Certificate&) = delete;
    Certificate(Certificate&& other) noexcept;
    Certificate& operator=(Certificate&& other) noexcept;

    // RSA 2048 / SHA-256 self-signed server certificate.
    // SAN covers common_name, localhost and 127.0.0.1.
    bool generate_self_signed(const std::string& common_name, int valid_days = 365);

    bool load_pem(const std::string& cert_file, const std::string& key_file);

    // Wrong password or corrupt file: logged, returns false
    bool load_pkcs12(const std::string& path, const std::string& password);
    bool save_pkcs12(const std::string& path, const std::string& password) const;

    bool is_valid() const { return m_cert != nullptr && m_key != nullptr; }

    X509* cert() const { return m_cert; }
    EVP_PKEY* key() const { return m_key; }

    std::string subject_name() const;

    // SHA-256 over the DER encoding, colon-separated uppercase hex
    std::string fingerprint() const;

private:
    void reset();

    X509* m_cert = nullptr;
    EVP_PKEY* m_key = nullptr;
};

}  // namespace deskstream

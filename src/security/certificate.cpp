#include "certificate.hpp"
#include "ssl_error.hpp"
#include "../util/logger.hpp"
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>
#include <sys/stat.h>
#include <cstdio>
#include <utility>

namespace deskstream {

namespace {

bool add_extension(X509* cert, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);

    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
    if (!ext) {
        return false;
    }
    int ok = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    return ok == 1;
}

bool set_random_serial(X509* cert) {
    BIGNUM* bn = BN_new();
    if (!bn) return false;

    bool ok = BN_rand(bn, 127, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) == 1 &&
              BN_to_ASN1_INTEGER(bn, X509_get_serialNumber(cert)) != nullptr;
    BN_free(bn);
    return ok;
}

}  // namespace

Certificate::~Certificate() {
    reset();
}

Certificate::Certificate(Certificate&& other) noexcept
    : m_cert(other.m_cert), m_key(other.m_key) {
    other.m_cert = nullptr;
    other.m_key = nullptr;
}

Certificate& Certificate::operator=(Certificate&& other) noexcept {
    if (this != &other) {
        reset();
        m_cert = std::exchange(other.m_cert, nullptr);
        m_key = std::exchange(other.m_key, nullptr);
    }
    return *this;
}

void Certificate::reset() {
    if (m_cert) {
        X509_free(m_cert);
        m_cert = nullptr;
    }
    if (m_key) {
        EVP_PKEY_free(m_key);
        m_key = nullptr;
    }
}

bool Certificate::generate_self_signed(const std::string& common_name, int valid_days) {
    reset();

    EVP_PKEY* key = EVP_RSA_gen(2048);
    if (!key) {
        LOG_ERROR("RSA key generation failed: %s", drain_ssl_errors().c_str());
        return false;
    }

    X509* cert = X509_new();
    if (!cert) {
        LOG_ERROR("X509_new failed: %s", drain_ssl_errors().c_str());
        EVP_PKEY_free(key);
        return false;
    }

    bool ok = X509_set_version(cert, 2) == 1 && set_random_serial(cert);

    ok = ok && X509_gmtime_adj(X509_getm_notBefore(cert), 0) != nullptr;
    ok = ok && X509_gmtime_adj(X509_getm_notAfter(cert), 60L * 60 * 24 * valid_days) != nullptr;
    ok = ok && X509_set_pubkey(cert, key) == 1;

    if (ok) {
        X509_NAME* name = X509_get_subject_name(cert);
        ok = X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                                        reinterpret_cast<const unsigned char*>(common_name.c_str()),
                                        -1, -1, 0) == 1 &&
             X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                        reinterpret_cast<const unsigned char*>("deskstream"),
                                        -1, -1, 0) == 1 &&
             X509_set_issuer_name(cert, name) == 1;
    }

    ok = ok && add_extension(cert, NID_basic_constraints, "critical,CA:FALSE");
    ok = ok && add_extension(cert, NID_key_usage, "critical,digitalSignature,keyEncipherment");
    ok = ok && add_extension(cert, NID_ext_key_usage, "serverAuth");
    ok = ok && add_extension(cert, NID_subject_key_identifier, "hash");

    std::string san = "DNS:localhost,IP:127.0.0.1";
    if (!common_name.empty() && common_name != "localhost") {
        san = "DNS:" + common_name + "," + san;
    }
    ok = ok && add_extension(cert, NID_subject_alt_name, san);

    ok = ok && X509_sign(cert, key, EVP_sha256()) > 0;

    if (!ok) {
        LOG_ERROR("Failed to build self-signed certificate: %s", drain_ssl_errors().c_str());
        X509_free(cert);
        EVP_PKEY_free(key);
        return false;
    }

    m_cert = cert;
    m_key = key;
    LOG_INFO("Generated self-signed certificate for '%s' (valid %d days)",
             common_name.c_str(), valid_days);
    return true;
}

bool Certificate::load_pem(const std::string& cert_file, const std::string& key_file) {
    reset();

    BIO* cert_bio = BIO_new_file(cert_file.c_str(), "r");
    if (!cert_bio) {
        LOG_ERROR("Failed to open certificate: %s", cert_file.c_str());
        drain_ssl_errors();
        return false;
    }
    X509* cert = PEM_read_bio_X509(cert_bio, nullptr, nullptr, nullptr);
    BIO_free(cert_bio);
    if (!cert) {
        LOG_ERROR("Failed to parse certificate %s: %s", cert_file.c_str(), drain_ssl_errors().c_str());
        return false;
    }

    BIO* key_bio = BIO_new_file(key_file.c_str(), "r");
    if (!key_bio) {
        LOG_ERROR("Failed to open private key: %s", key_file.c_str());
        drain_ssl_errors();
        X509_free(cert);
        return false;
    }
    EVP_PKEY* key = PEM_read_bio_PrivateKey(key_bio, nullptr, nullptr, nullptr);
    BIO_free(key_bio);
    if (!key) {
        LOG_ERROR("Failed to parse private key %s: %s", key_file.c_str(), drain_ssl_errors().c_str());
        X509_free(cert);
        return false;
    }

    if (X509_check_private_key(cert, key) != 1) {
        LOG_ERROR("Private key doesn't match certificate");
        drain_ssl_errors();
        X509_free(cert);
        EVP_PKEY_free(key);
        return false;
    }

    m_cert = cert;
    m_key = key;
    return true;
}

bool Certificate::load_pkcs12(const std::string& path, const std::string& password) {
    reset();

    BIO* bio = BIO_new_file(path.c_str(), "rb");
    if (!bio) {
        LOG_ERROR("Failed to open PKCS#12 file: %s", path.c_str());
        drain_ssl_errors();
        return false;
    }
    PKCS12* p12 = d2i_PKCS12_bio(bio, nullptr);
    BIO_free(bio);
    if (!p12) {
        LOG_ERROR("Failed to parse PKCS#12 file %s: %s", path.c_str(), drain_ssl_errors().c_str());
        return false;
    }

    EVP_PKEY* key = nullptr;
    X509* cert = nullptr;
    STACK_OF(X509)* chain = nullptr;
    int ok = PKCS12_parse(p12, password.c_str(), &key, &cert, &chain);
    PKCS12_free(p12);
    if (chain) {
        sk_X509_pop_free(chain, X509_free);
    }

    if (ok != 1 || !cert || !key) {
        LOG_ERROR("Failed to unlock PKCS#12 file %s (wrong password?): %s",
                  path.c_str(), drain_ssl_errors().c_str());
        X509_free(cert);
        EVP_PKEY_free(key);
        return false;
    }

    m_cert = cert;
    m_key = key;
    LOG_INFO("Loaded certificate from %s", path.c_str());
    return true;
}

bool Certificate::save_pkcs12(const std::string& path, const std::string& password) const {
    if (!is_valid()) {
        LOG_ERROR("No certificate to save");
        return false;
    }

    const char* pass = password.empty() ? nullptr : password.c_str();
    PKCS12* p12 = PKCS12_create(pass, "deskstream", m_key, m_cert, nullptr, 0, 0, 0, 0, 0);
    if (!p12) {
        LOG_ERROR("PKCS12_create failed: %s", drain_ssl_errors().c_str());
        return false;
    }

    BIO* bio = BIO_new_file(path.c_str(), "wb");
    if (!bio) {
        LOG_ERROR("Failed to open %s for writing", path.c_str());
        drain_ssl_errors();
        PKCS12_free(p12);
        return false;
    }

    int ok = i2d_PKCS12_bio(bio, p12);
    BIO_free(bio);
    PKCS12_free(p12);

    if (ok != 1) {
        LOG_ERROR("Failed to write PKCS#12 file %s: %s", path.c_str(), drain_ssl_errors().c_str());
        return false;
    }

    // Private key inside
    if (chmod(path.c_str(), 0600) != 0) {
        LOG_WARN("Failed to restrict permissions on %s", path.c_str());
    }

    LOG_INFO("Saved certificate to %s", path.c_str());
    return true;
}

std::string Certificate::subject_name() const {
    if (!m_cert) return "";

    char buf[256];
    X509_NAME_oneline(X509_get_subject_name(m_cert), buf, sizeof(buf));
    return buf;
}

std::string Certificate::fingerprint() const {
    if (!m_cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (X509_digest(m_cert, EVP_sha256(), md, &len) != 1) {
        drain_ssl_errors();
        return "";
    }

    std::string out;
    out.reserve(len * 3);
    for (unsigned int i = 0; i < len; i++) {
        char hex[4];
        snprintf(hex, sizeof(hex), i + 1 < len ? "%02X:" : "%02X", md[i]);
        out += hex;
    }
    return out;
}

}  // namespace deskstream

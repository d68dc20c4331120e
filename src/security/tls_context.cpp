#include "tls_context.hpp"
#include "certificate.hpp"
#include "ssl_error.hpp"
#include "../util/logger.hpp"

namespace deskstream {

TLSContext::TLSContext() = default;

TLSContext::~TLSContext() {
    shutdown();
}

bool TLSContext::create(const SSL_METHOD* method) {
    shutdown();
    OPENSSL_init_ssl(0, nullptr);

    m_ctx = SSL_CTX_new(method);
    if (!m_ctx) {
        LOG_ERROR("Failed to create SSL context: %s", drain_ssl_errors().c_str());
        return false;
    }

    // Set minimum TLS version to 1.3
    if (SSL_CTX_set_min_proto_version(m_ctx, TLS1_3_VERSION) != 1) {
        LOG_ERROR("Failed to require TLS 1.3: %s", drain_ssl_errors().c_str());
        shutdown();
        return false;
    }

    // Writes may be retried with a different buffer after WANT_WRITE
    SSL_CTX_set_mode(m_ctx, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER | SSL_MODE_ENABLE_PARTIAL_WRITE);
    return true;
}

bool TLSContext::init_server(const TlsConfig& config, const std::string& common_name) {
    if (!create(TLS_server_method())) {
        return false;
    }

    Certificate cert;
    bool loaded = false;
    if (!config.pkcs12_file.empty()) {
        loaded = cert.load_pkcs12(config.pkcs12_file, config.pkcs12_password);
    } else if (!config.cert_file.empty() || !config.key_file.empty()) {
        loaded = cert.load_pem(config.cert_file, config.key_file);
    } else {
        loaded = cert.generate_self_signed(common_name);
        if (loaded && !config.save_generated_to.empty()) {
            // Failure to persist is not fatal; the next start regenerates
            cert.save_pkcs12(config.save_generated_to, config.pkcs12_password);
        }
    }

    if (!loaded) {
        shutdown();
        return false;
    }

    if (SSL_CTX_use_certificate(m_ctx, cert.cert()) != 1) {
        LOG_ERROR("Failed to install certificate: %s", drain_ssl_errors().c_str());
        shutdown();
        return false;
    }

    if (SSL_CTX_use_PrivateKey(m_ctx, cert.key()) != 1) {
        LOG_ERROR("Failed to install private key: %s", drain_ssl_errors().c_str());
        shutdown();
        return false;
    }

    // Verify private key
    if (!SSL_CTX_check_private_key(m_ctx)) {
        LOG_ERROR("Private key doesn't match certificate");
        drain_ssl_errors();
        shutdown();
        return false;
    }

    // Load CA for client verification (optional)
    if (!config.ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(m_ctx, config.ca_file.c_str(), nullptr) <= 0) {
            LOG_WARN("Failed to load CA file %s: %s", config.ca_file.c_str(), drain_ssl_errors().c_str());
        } else {
            SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);
            LOG_INFO("Client certificate verification enabled");
        }
    }

    m_fingerprint = cert.fingerprint();
    LOG_INFO("TLS server context initialized (%s, SHA-256 %s)",
             cert.subject_name().c_str(), m_fingerprint.c_str());
    return true;
}

bool TLSContext::init_client(const TlsConfig& config) {
    if (!create(TLS_client_method())) {
        return false;
    }

    m_verify_peer = config.verify_peer;
    m_target_host = config.target_host;

    if (m_verify_peer) {
        int loaded = config.ca_file.empty()
                         ? SSL_CTX_set_default_verify_paths(m_ctx)
                         : SSL_CTX_load_verify_locations(m_ctx, config.ca_file.c_str(), nullptr);
        if (loaded <= 0) {
            LOG_ERROR("Failed to load trust anchors: %s", drain_ssl_errors().c_str());
            shutdown();
            return false;
        }
        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER, nullptr);
        LOG_INFO("TLS client context initialized (peer verification on)");
    } else {
        // Self-signed hosts on the LAN are accepted as-is
        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, nullptr);
        LOG_INFO("TLS client context initialized (peer verification off)");
    }

    return true;
}

bool TLSContext::configure_client(SSL* ssl) const {
    if (m_target_host.empty()) {
        return true;
    }

    if (SSL_set_tlsext_host_name(ssl, m_target_host.c_str()) != 1) {
        LOG_WARN("Failed to set SNI '%s': %s", m_target_host.c_str(), drain_ssl_errors().c_str());
    }

    if (m_verify_peer && SSL_set1_host(ssl, m_target_host.c_str()) != 1) {
        LOG_ERROR("Failed to set expected host '%s': %s", m_target_host.c_str(),
                  drain_ssl_errors().c_str());
        return false;
    }
    return true;
}

void TLSContext::shutdown() {
    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
    m_fingerprint.clear();
}

}  // namespace deskstream

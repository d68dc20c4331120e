#pragma once

#include <string>
#include <openssl/ssl.h>
#include "deskstream/config.hpp"

namespace deskstream {

class TLSContext {
public:
    TLSContext();
    ~TLSContext();

    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    // Initialize as server. Certificate source, in order: PKCS#12 bundle,
    // PEM pair, generated self-signed for common_name.
    bool init_server(const TlsConfig& config, const std::string& common_name);

    // Initialize as client. No peer verification unless config.verify_peer.
    bool init_client(const TlsConfig& config);

    // Per-connection client setup: SNI and hostname check
    bool configure_client(SSL* ssl) const;

    SSL_CTX* get() const { return m_ctx; }

    bool is_valid() const { return m_ctx != nullptr; }

    // Server certificate fingerprint (empty for client contexts)
    const std::string& fingerprint() const { return m_fingerprint; }

    void shutdown();

private:
    bool create(const SSL_METHOD* method);

    SSL_CTX* m_ctx = nullptr;
    bool m_verify_peer = false;
    std::string m_target_host;
    std::string m_fingerprint;
};

}  // namespace deskstream

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace deskstream {

struct TlsConfig {
    bool enabled = true;

    // Host side: PEM pair, or a PKCS#12 bundle. Neither set = self-signed on demand.
    std::string cert_file;
    std::string key_file;
    std::string pkcs12_file;
    std::string pkcs12_password;
    std::string save_generated_to;   // Persist the generated cert as PKCS#12 (optional)

    // Client side: LAN trust model by default
    bool verify_peer = false;
    std::string ca_file;
    std::string target_host;          // Hostname to verify when verify_peer is set
};

struct TransportConfig {
    int connect_timeout_ms = 5000;
    int handshake_timeout_ms = 5000;
    int write_timeout_ms = 2000;
    int disconnect_timeout_ms = 1000;
    size_t max_queued_frames = 64;
    TlsConfig tls;
};

struct HostConfig {
    std::string host_id;              // Empty = derive from hostname
    std::string host_name;

    // Network
    uint16_t port = 9600;

    // Capture (synthetic source dimensions)
    int capture_width = 1280;
    int capture_height = 720;

    // Encoding
    int delta_threshold = 30;         // Percent of changed pixels before a full frame is sent

    // Pairing
    int pin_ttl_seconds = 300;
    int max_pin_attempts = 5;

    // Sessions
    int max_reconnect_attempts = 3;
    int reconnect_window_ms = 30000;  // Time a dropped client has to come back

    int quality_report_interval_ms = 2000;

    TransportConfig transport;
};

struct ClientConfig {
    std::string client_id;            // Empty = derive from hostname
    std::string client_name;

    std::string host_address = "127.0.0.1";
    uint16_t port = 9600;
    std::string pin;

    int pairing_timeout_ms = 10000;
    int max_reconnect_attempts = 3;
    int reconnect_delay_ms = 1000;    // Base backoff, doubled per attempt
    int max_reconnect_delay_ms = 8000;

    std::string snapshot_file;        // Write last reconstructed frame as PPM (optional)

    TransportConfig transport;
};

// Wire protocol constants
constexpr uint32_t MAX_FRAME_SIZE = 64u * 1024u * 1024u;  // 64 MiB guard
constexpr size_t FRAME_HEADER_SIZE = 5;                   // [length:4][type:1]

constexpr int BLOCK_SIZE = 64;            // Delta codec block edge in pixels
constexpr int BYTES_PER_PIXEL = 4;        // Raw frames are BGRA

}  // namespace deskstream

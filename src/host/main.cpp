#include "desktop_host.hpp"
#include "../capture/test_pattern_capture.hpp"
#include "../util/logger.hpp"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>

using namespace deskstream;

static DesktopHost* g_host = nullptr;
static volatile sig_atomic_t g_signal_count = 0;

static void signal_handler(int) {
    g_signal_count = g_signal_count + 1;
    int count = g_signal_count;

    if (count == 1) {
        // First signal - request graceful shutdown
        // Logger takes a mutex, so nothing is logged from here
        if (g_host) {
            g_host->stop();
        }
    } else {
        // Second signal - force exit but still run destructors
        exit(0);
    }
}

static void print_usage(const char* prog) {
    printf("Usage: %s [options]\n", prog);
    printf("Options:\n");
    printf("  -p, --port PORT           Listen port (default: 9600)\n");
    printf("  -n, --name NAME           Host name shown to viewers (default: hostname)\n");
    printf("  -W, --width PIXELS        Capture width (default: 1280)\n");
    printf("  -H, --height PIXELS       Capture height (default: 720)\n");
    printf("  -d, --delta-threshold PCT Changed-pixel percentage that forces a full frame, 0-100 (default: 30)\n");
    printf("  -t, --pin-ttl SECONDS     Pairing PIN lifetime (default: 300)\n");
    printf("  -m, --max-attempts N      Failed PIN attempts before lockout (default: 5)\n");
    printf("  -r, --max-reconnects N    Reconnects allowed per session (default: 3)\n");
    printf("  -w, --reconnect-window MS Time a dropped viewer has to come back (default: 30000)\n");
    printf("  -N, --no-tls              Disable TLS (trusted networks and testing only)\n");
    printf("  -c, --cert FILE           PEM certificate\n");
    printf("  -k, --key FILE            PEM private key\n");
    printf("  -x, --pkcs12 FILE         PKCS#12 certificate bundle\n");
    printf("  -X, --pkcs12-password PW  Password for the PKCS#12 bundle\n");
    printf("  -s, --save-cert FILE      Save a generated certificate as PKCS#12\n");
    printf("  -v, --verbose             Enable info logging (use -vv for debug)\n");
    printf("  -h, --help                Show this help\n");
    printf("\nWithout a certificate a self-signed one is generated at startup.\n");
}

int main(int argc, char* argv[]) {
    HostConfig config;

    static struct option long_options[] = {
        {"port", required_argument, 0, 'p'},
        {"name", required_argument, 0, 'n'},
        {"width", required_argument, 0, 'W'},
        {"height", required_argument, 0, 'H'},
        {"delta-threshold", required_argument, 0, 'd'},
        {"pin-ttl", required_argument, 0, 't'},
        {"max-attempts", required_argument, 0, 'm'},
        {"max-reconnects", required_argument, 0, 'r'},
        {"reconnect-window", required_argument, 0, 'w'},
        {"no-tls", no_argument, 0, 'N'},
        {"cert", required_argument, 0, 'c'},
        {"key", required_argument, 0, 'k'},
        {"pkcs12", required_argument, 0, 'x'},
        {"pkcs12-password", required_argument, 0, 'X'},
        {"save-cert", required_argument, 0, 's'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int verbosity = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "p:n:W:H:d:t:m:r:w:Nc:k:x:X:s:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'p':
                config.port = static_cast<uint16_t>(atoi(optarg));
                break;
            case 'n':
                config.host_name = optarg;
                break;
            case 'W':
                config.capture_width = atoi(optarg);
                if (config.capture_width < 64) config.capture_width = 64;
                if (config.capture_width > 7680) config.capture_width = 7680;
                break;
            case 'H':
                config.capture_height = atoi(optarg);
                if (config.capture_height < 64) config.capture_height = 64;
                if (config.capture_height > 4320) config.capture_height = 4320;
                break;
            case 'd':
                config.delta_threshold = atoi(optarg);
                if (config.delta_threshold < 0) config.delta_threshold = 0;
                if (config.delta_threshold > 100) config.delta_threshold = 100;
                break;
            case 't':
                config.pin_ttl_seconds = atoi(optarg);
                if (config.pin_ttl_seconds < 10) config.pin_ttl_seconds = 10;
                break;
            case 'm':
                config.max_pin_attempts = atoi(optarg);
                if (config.max_pin_attempts < 1) config.max_pin_attempts = 1;
                break;
            case 'r':
                config.max_reconnect_attempts = atoi(optarg);
                if (config.max_reconnect_attempts < 0) config.max_reconnect_attempts = 0;
                break;
            case 'w':
                config.reconnect_window_ms = atoi(optarg);
                if (config.reconnect_window_ms < 1000) config.reconnect_window_ms = 1000;
                break;
            case 'N':
                config.transport.tls.enabled = false;
                break;
            case 'c':
                config.transport.tls.cert_file = optarg;
                break;
            case 'k':
                config.transport.tls.key_file = optarg;
                break;
            case 'x':
                config.transport.tls.pkcs12_file = optarg;
                break;
            case 'X':
                config.transport.tls.pkcs12_password = optarg;
                break;
            case 's':
                config.transport.tls.save_generated_to = optarg;
                break;
            case 'v':
                verbosity++;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    Logger::set_verbosity(verbosity);

    if (config.transport.tls.cert_file.empty() != config.transport.tls.key_file.empty()) {
        fprintf(stderr, "--cert and --key must be given together\n");
        return 1;
    }

    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    DesktopHost host(std::make_unique<TestPatternCapture>());
    g_host = &host;

    if (!host.init(config)) {
        LOG_ERROR("Failed to initialize host");
        g_host = nullptr;
        return 1;
    }

    // Always show startup info (regardless of verbosity)
    printf("DeskStream Host v1.0.0\n");
    printf("Capture: %dx%d | Delta threshold: %d%% | Port: %u | TLS: %s\n",
           config.capture_width, config.capture_height, config.delta_threshold,
           host.port(), config.transport.tls.enabled ? "on" : "off");
    if (config.transport.tls.enabled) {
        printf("Certificate SHA-256: %s\n", host.tls_fingerprint().c_str());
    }
    printf("Waiting for connection... (use -v for detailed logs)\n");
    fflush(stdout);

    host.run();

    g_host = nullptr;
    LOG_INFO("Host exited");
    return 0;
}

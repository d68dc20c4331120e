#include "desktop_client.hpp"
#include "../util/logger.hpp"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>

using namespace deskstream;

static DesktopClient* g_client = nullptr;
static volatile sig_atomic_t g_signal_count = 0;

static void signal_handler(int) {
    g_signal_count = g_signal_count + 1;
    int count = g_signal_count;

    if (count == 1) {
        // Logger takes a mutex, so nothing is logged from here
        if (g_client) {
            g_client->stop();
        }
    } else {
        exit(0);
    }
}

static void print_usage(const char* prog) {
    printf("Usage: %s [options] -P PIN\n", prog);
    printf("Options:\n");
    printf("  -a, --address HOST        Host address (default: 127.0.0.1)\n");
    printf("  -p, --port PORT           Host port (default: 9600)\n");
    printf("  -P, --pin PIN             Pairing PIN shown by the host\n");
    printf("  -n, --name NAME           Viewer name shown to the host (default: hostname)\n");
    printf("  -o, --snapshot FILE       Write the latest frame to FILE as PPM (once per second)\n");
    printf("  -T, --pairing-timeout MS  Time to wait for the pairing answer (default: 10000)\n");
    printf("  -r, --max-reconnects N    Reconnect attempts before giving up (default: 3)\n");
    printf("  -N, --no-tls              Disable TLS (must match the host)\n");
    printf("  -V, --verify              Verify the host certificate chain and name\n");
    printf("  -C, --ca-file FILE        CA bundle for --verify\n");
    printf("  -S, --tls-host NAME       Expected certificate name (default: address)\n");
    printf("  -v, --verbose             Enable info logging (use -vv for debug)\n");
    printf("  -h, --help                Show this help\n");
}

int main(int argc, char* argv[]) {
    ClientConfig config;

    static struct option long_options[] = {
        {"address", required_argument, 0, 'a'},
        {"port", required_argument, 0, 'p'},
        {"pin", required_argument, 0, 'P'},
        {"name", required_argument, 0, 'n'},
        {"snapshot", required_argument, 0, 'o'},
        {"pairing-timeout", required_argument, 0, 'T'},
        {"max-reconnects", required_argument, 0, 'r'},
        {"no-tls", no_argument, 0, 'N'},
        {"verify", no_argument, 0, 'V'},
        {"ca-file", required_argument, 0, 'C'},
        {"tls-host", required_argument, 0, 'S'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int verbosity = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "a:p:P:n:o:T:r:NVC:S:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'a':
                config.host_address = optarg;
                break;
            case 'p':
                config.port = static_cast<uint16_t>(atoi(optarg));
                break;
            case 'P':
                config.pin = optarg;
                break;
            case 'n':
                config.client_name = optarg;
                break;
            case 'o':
                config.snapshot_file = optarg;
                break;
            case 'T':
                config.pairing_timeout_ms = atoi(optarg);
                if (config.pairing_timeout_ms < 1000) config.pairing_timeout_ms = 1000;
                if (config.pairing_timeout_ms > 60000) config.pairing_timeout_ms = 60000;
                break;
            case 'r':
                config.max_reconnect_attempts = atoi(optarg);
                if (config.max_reconnect_attempts < 0) config.max_reconnect_attempts = 0;
                break;
            case 'N':
                config.transport.tls.enabled = false;
                break;
            case 'V':
                config.transport.tls.verify_peer = true;
                break;
            case 'C':
                config.transport.tls.ca_file = optarg;
                break;
            case 'S':
                config.transport.tls.target_host = optarg;
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

    if (config.pin.empty()) {
        fprintf(stderr, "A pairing PIN is required\n");
        print_usage(argv[0]);
        return 1;
    }
    if (config.transport.tls.target_host.empty()) {
        config.transport.tls.target_host = config.host_address;
    }

    printf("DeskStream Viewer v1.0.0\n");
    printf("Host: %s:%u | TLS: %s\n", config.host_address.c_str(), config.port,
           !config.transport.tls.enabled ? "off" : (config.transport.tls.verify_peer ? "verified" : "on"));
    fflush(stdout);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    DesktopClient client;
    g_client = &client;

    if (!client.init(config)) {
        LOG_ERROR("Failed to initialize viewer");
        g_client = nullptr;
        return 1;
    }

    if (!client.connect(config.host_address, config.port, config.pin)) {
        fprintf(stderr, "Could not pair with %s:%u\n", config.host_address.c_str(), config.port);
        g_client = nullptr;
        return 1;
    }

    client.run();

    const uint64_t received = client.frames_received();
    const uint64_t rejected = client.frames_rejected();
    g_client = nullptr;
    printf("Frames received: %llu (rejected: %llu)\n",
           static_cast<unsigned long long>(received), static_cast<unsigned long long>(rejected));
    return 0;
}

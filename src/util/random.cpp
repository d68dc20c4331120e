#include "random.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <stdexcept>
#include <cstdio>
#include <limits>

namespace deskstream {

void random_bytes(uint8_t* out, size_t len) {
    if (len == 0) return;
    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
        char err[256];
        ERR_error_string_n(ERR_get_error(), err, sizeof(err));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + err);
    }
}

uint32_t random_uniform(uint32_t upper) {
    if (upper == 0) {
        throw std::invalid_argument("random_uniform: upper bound must be positive");
    }

    // Rejection sampling to avoid modulo bias
    const uint32_t limit = std::numeric_limits<uint32_t>::max() -
                           (std::numeric_limits<uint32_t>::max() % upper);
    uint32_t value;
    do {
        uint8_t buf[4];
        random_bytes(buf, sizeof(buf));
        value = (static_cast<uint32_t>(buf[0]) << 24) | (static_cast<uint32_t>(buf[1]) << 16) |
                (static_cast<uint32_t>(buf[2]) << 8) | buf[3];
    } while (value >= limit);

    return value % upper;
}

std::string generate_id() {
    uint8_t b[16];
    random_bytes(b, sizeof(b));

    b[6] = (b[6] & 0x0F) | 0x40;  // version 4
    b[8] = (b[8] & 0x3F) | 0x80;  // RFC 4122 variant

    char out[37];
    snprintf(out, sizeof(out),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
             b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return out;
}

}  // namespace deskstream

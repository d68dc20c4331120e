#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace deskstream {

// CSPRNG helpers backed by OpenSSL RAND_bytes.
// RAND_bytes failing means the process has no entropy source; that is not an
// operational condition, so these throw std::runtime_error.

void random_bytes(uint8_t* out, size_t len);

// Uniform value in [0, upper)
uint32_t random_uniform(uint32_t upper);

// 128-bit random identifier formatted as 8-4-4-4-12 lowercase hex (UUID v4 layout)
std::string generate_id();

}  // namespace deskstream

#pragma once

#include <string>

namespace deskstream {

// Drain the thread's OpenSSL error queue into one "; "-separated line.
// Returns "no OpenSSL error" when the queue is empty.
std::string drain_ssl_errors();

}  // namespace deskstream

#include "ssl_error.hpp"
#include <openssl/err.h>

namespace deskstream {

std::string drain_ssl_errors() {
    std::string out;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? "no OpenSSL error" : out;
}

}  // namespace deskstream

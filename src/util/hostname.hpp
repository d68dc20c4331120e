#pragma once

#include <string>
#include <unistd.h>

namespace deskstream {

// Machine name for default ids and certificate CN
inline std::string local_hostname() {
    char name[256] = {};
    if (gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0') {
        return "localhost";
    }
    return name;
}

}  // namespace deskstream

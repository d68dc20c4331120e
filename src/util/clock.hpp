#pragma once

#include <chrono>
#include <cstdint>

namespace deskstream {

using Timestamp = std::chrono::system_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

// Time source used for TTLs, rate limiting and duration accounting.
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override { return std::chrono::system_clock::now(); }

    // Shared default for components constructed without a clock
    static const Clock& instance() {
        static const SystemClock s_clock;
        return s_clock;
    }
};

inline int64_t to_unix_ms(Timestamp ts) {
    return std::chrono::duration_cast<Milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_ms(int64_t ms) {
    return Timestamp(Milliseconds(ms));
}

}  // namespace deskstream

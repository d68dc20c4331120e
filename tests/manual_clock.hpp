#pragma once

#include <mutex>
#include "util/clock.hpp"

namespace deskstream {

// Test clock that only moves when told to
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = from_unix_ms(1700000000000)) : m_now(start) {}

    Timestamp now() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }

    void advance(Milliseconds delta) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += delta;
    }

private:
    mutable std::mutex m_mutex;
    Timestamp m_now;
};

}  // namespace deskstream

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include "../protocol/messages.hpp"
#include "../util/clock.hpp"

namespace deskstream {

// Sliding-window throughput and latency figures for the periodic
// ConnectionQuality report. Purely observational.
class PerformanceMonitor {
public:
    static constexpr size_t WINDOW_SIZE = 30;

    explicit PerformanceMonitor(const Clock& clock = SystemClock::instance());

    void record_frame_sent(size_t bytes);
    void record_latency(Milliseconds latency);

    double current_fps() const;
    int64_t current_bandwidth() const;     // Bytes per second
    int64_t average_latency_ms() const;

    // Current figures plus the derived rating
    ConnectionQuality snapshot() const;

    void reset();

private:
    struct FrameSample {
        Timestamp sent_at;
        size_t bytes = 0;
    };

    double fps_locked() const;
    int64_t bandwidth_locked() const;
    int64_t latency_locked() const;

    const Clock& m_clock;

    mutable std::mutex m_mutex;
    std::deque<FrameSample> m_frames;
    std::deque<Milliseconds> m_latencies;
};

}  // namespace deskstream

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include "../util/clock.hpp"

namespace deskstream {

// Closed-loop tuning of encoder quality and capture frame rate from frame
// sizes (send path) and acknowledged latencies (receive path).
// Output is advisory; callers read current_quality()/current_frame_rate().
class AdaptiveQualityController {
public:
    static constexpr int DEFAULT_QUALITY = 75;
    static constexpr int MIN_QUALITY = 30;
    static constexpr int MAX_QUALITY = 95;

    static constexpr int DEFAULT_FRAME_RATE = 30;
    static constexpr int MIN_FRAME_RATE = 10;
    static constexpr int MAX_FRAME_RATE = 60;

    static constexpr size_t WINDOW_SIZE = 30;
    static constexpr size_t MIN_LATENCY_SAMPLES = 5;
    static constexpr size_t MIN_SIZE_SAMPLES = 10;
    static constexpr std::chrono::seconds UPDATE_INTERVAL{2};

    explicit AdaptiveQualityController(const Clock& clock = SystemClock::instance());

    void record_frame_sent(size_t bytes);
    void record_frame_ack(Milliseconds latency);

    // Recompute settings. Needs MIN_LATENCY_SAMPLES new acks and
    // UPDATE_INTERVAL since the last recompute; returns false otherwise.
    bool update_settings();

    int current_quality() const;
    int current_frame_rate() const;

    // Defaults restored, history cleared
    void reset();

private:
    const Clock& m_clock;

    mutable std::mutex m_mutex;
    std::deque<size_t> m_frame_sizes;
    std::deque<Milliseconds> m_latencies;
    size_t m_acks_since_update = 0;
    Timestamp m_last_update;

    int m_quality = DEFAULT_QUALITY;
    int m_frame_rate = DEFAULT_FRAME_RATE;
};

}  // namespace deskstream

#include "adaptive_quality_controller.hpp"
#include "../util/logger.hpp"
#include <algorithm>

namespace deskstream {

namespace {

constexpr double HIGH_LATENCY_MS = 500.0;
constexpr double MODERATE_LATENCY_MS = 200.0;
constexpr double TARGET_LATENCY_MS = 100.0;

constexpr double LARGE_FRAME_KIB = 500.0;
constexpr double SMALL_FRAME_KIB = 100.0;

}  // namespace

AdaptiveQualityController::AdaptiveQualityController(const Clock& clock)
    : m_clock(clock), m_last_update(clock.now()) {}

void AdaptiveQualityController::record_frame_sent(size_t bytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frame_sizes.push_back(bytes);
    if (m_frame_sizes.size() > WINDOW_SIZE) {
        m_frame_sizes.pop_front();
    }
}

void AdaptiveQualityController::record_frame_ack(Milliseconds latency) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_latencies.push_back(std::max(latency, Milliseconds(0)));
    if (m_latencies.size() > WINDOW_SIZE) {
        m_latencies.pop_front();
    }
    m_acks_since_update++;
}

bool AdaptiveQualityController::update_settings() {
    std::lock_guard<std::mutex> lock(m_mutex);

    const Timestamp now = m_clock.now();
    if (now - m_last_update < UPDATE_INTERVAL || m_acks_since_update < MIN_LATENCY_SAMPLES) {
        return false;
    }
    m_last_update = now;
    m_acks_since_update = 0;

    double latency_sum = 0.0;
    for (const auto& l : m_latencies) {
        latency_sum += static_cast<double>(l.count());
    }
    const double avg_latency = latency_sum / static_cast<double>(m_latencies.size());

    int quality = m_quality;
    int frame_rate = m_frame_rate;

    if (avg_latency > HIGH_LATENCY_MS) {
        quality -= 15;
        frame_rate -= 5;
    } else if (avg_latency >= MODERATE_LATENCY_MS) {
        quality -= 10;
    } else if (avg_latency < TARGET_LATENCY_MS) {
        quality += 5;
        if (frame_rate < DEFAULT_FRAME_RATE) {
            frame_rate += 2;
        }
    }

    // Frame size stands in for bandwidth pressure
    if (m_frame_sizes.size() >= MIN_SIZE_SAMPLES) {
        double size_sum = 0.0;
        for (size_t s : m_frame_sizes) {
            size_sum += static_cast<double>(s);
        }
        const double avg_kib = size_sum / static_cast<double>(m_frame_sizes.size()) / 1024.0;

        if (avg_kib > LARGE_FRAME_KIB) {
            frame_rate -= 3;
        } else if (avg_kib < SMALL_FRAME_KIB && frame_rate < DEFAULT_FRAME_RATE) {
            frame_rate += 2;
        }
    }

    quality = std::clamp(quality, MIN_QUALITY, MAX_QUALITY);
    frame_rate = std::clamp(frame_rate, MIN_FRAME_RATE, MAX_FRAME_RATE);

    if (quality != m_quality || frame_rate != m_frame_rate) {
        LOG_INFO("Quality %d -> %d, frame rate %d -> %d (avg latency %.0f ms)",
                 m_quality, quality, m_frame_rate, frame_rate, avg_latency);
    }
    m_quality = quality;
    m_frame_rate = frame_rate;
    return true;
}

int AdaptiveQualityController::current_quality() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_quality;
}

int AdaptiveQualityController::current_frame_rate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frame_rate;
}

void AdaptiveQualityController::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frame_sizes.clear();
    m_latencies.clear();
    m_acks_since_update = 0;
    m_last_update = m_clock.now();
    m_quality = DEFAULT_QUALITY;
    m_frame_rate = DEFAULT_FRAME_RATE;
}

}  // namespace deskstream

#include "performance_monitor.hpp"

namespace deskstream {

PerformanceMonitor::PerformanceMonitor(const Clock& clock)
    : m_clock(clock) {}

void PerformanceMonitor::record_frame_sent(size_t bytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frames.push_back(FrameSample{m_clock.now(), bytes});
    while (m_frames.size() > WINDOW_SIZE) {
        m_frames.pop_front();
    }
}

void PerformanceMonitor::record_latency(Milliseconds latency) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_latencies.push_back(latency.count() < 0 ? Milliseconds(0) : latency);
    while (m_latencies.size() > WINDOW_SIZE) {
        m_latencies.pop_front();
    }
}

double PerformanceMonitor::current_fps() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return fps_locked();
}

int64_t PerformanceMonitor::current_bandwidth() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return bandwidth_locked();
}

int64_t PerformanceMonitor::average_latency_ms() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return latency_locked();
}

ConnectionQuality PerformanceMonitor::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    ConnectionQuality q;
    q.fps = fps_locked();
    q.bandwidth = bandwidth_locked();
    q.latency_ms = latency_locked();
    q.timestamp = m_clock.now();
    q.rating = calculate_rating(q.fps, q.latency_ms, q.bandwidth);
    return q;
}

void PerformanceMonitor::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frames.clear();
    m_latencies.clear();
}

double PerformanceMonitor::fps_locked() const {
    if (m_frames.size() < 2) {
        return 0.0;
    }
    const auto span = std::chrono::duration_cast<Milliseconds>(
        m_frames.back().sent_at - m_frames.front().sent_at).count();
    if (span <= 0) {
        return 0.0;
    }
    // n samples span n-1 intervals
    return static_cast<double>(m_frames.size() - 1) * 1000.0 / static_cast<double>(span);
}

int64_t PerformanceMonitor::bandwidth_locked() const {
    if (m_frames.size() < 2) {
        return 0;
    }
    const auto span = std::chrono::duration_cast<Milliseconds>(
        m_frames.back().sent_at - m_frames.front().sent_at).count();
    if (span <= 0) {
        return 0;
    }
    // The first sample opens the window; its bytes precede the measured span
    int64_t bytes = 0;
    for (size_t i = 1; i < m_frames.size(); i++) {
        bytes += static_cast<int64_t>(m_frames[i].bytes);
    }
    return bytes * 1000 / span;
}

int64_t PerformanceMonitor::latency_locked() const {
    if (m_latencies.empty()) {
        return 0;
    }
    int64_t sum = 0;
    for (const auto& l : m_latencies) {
        sum += l.count();
    }
    return sum / static_cast<int64_t>(m_latencies.size());
}

}  // namespace deskstream

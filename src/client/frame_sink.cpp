#include "frame_sink.hpp"
#include "deskstream/config.hpp"
#include "../util/logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace deskstream {

PpmSnapshotSink::PpmSnapshotSink(std::string path, std::chrono::milliseconds min_interval)
    : m_path(std::move(path)), m_min_interval(min_interval) {}

void PpmSnapshotSink::on_frame(const ScreenFrame& frame) {
    const auto now = std::chrono::steady_clock::now();
    if (m_has_written && now - m_last_write < m_min_interval) {
        return;
    }

    if (write_ppm(frame)) {
        m_last_write = now;
        m_has_written = true;
        m_written++;
    }
}

bool PpmSnapshotSink::write_ppm(const ScreenFrame& frame) const {
    if (frame.format != PixelFormat::RAW || frame.width <= 0 || frame.height <= 0) {
        LOG_DEBUG("Snapshot skipped: not a raw frame");
        return false;
    }
    const size_t pixels = static_cast<size_t>(frame.width) * static_cast<size_t>(frame.height);
    if (frame.data.size() != pixels * BYTES_PER_PIXEL) {
        LOG_WARN("Snapshot skipped: %zu bytes for %dx%d", frame.data.size(), frame.width, frame.height);
        return false;
    }

    // BGRA -> RGB
    std::vector<uint8_t> rgb(pixels * 3);
    for (size_t i = 0; i < pixels; i++) {
        rgb[i * 3 + 0] = frame.data[i * 4 + 2];
        rgb[i * 3 + 1] = frame.data[i * 4 + 1];
        rgb[i * 3 + 2] = frame.data[i * 4 + 0];
    }

    const std::string tmp_path = m_path + ".tmp";
    FILE* f = fopen(tmp_path.c_str(), "wb");
    if (!f) {
        LOG_ERROR("Failed to open %s: %s", tmp_path.c_str(), strerror(errno));
        return false;
    }

    bool ok = fprintf(f, "P6\n%d %d\n255\n", frame.width, frame.height) > 0 &&
              fwrite(rgb.data(), 1, rgb.size(), f) == rgb.size();
    if (fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        LOG_ERROR("Failed to write snapshot %s", tmp_path.c_str());
        remove(tmp_path.c_str());
        return false;
    }

    if (rename(tmp_path.c_str(), m_path.c_str()) != 0) {
        LOG_ERROR("Failed to replace %s: %s", m_path.c_str(), strerror(errno));
        remove(tmp_path.c_str());
        return false;
    }
    return true;
}

}  // namespace deskstream

#include "delta_frame_encoder.hpp"
#include "../util/logger.hpp"
#include "../util/random.hpp"
#include "deskstream/config.hpp"
#include <algorithm>
#include <cstring>
#include <map>
#include <utility>

namespace deskstream {

DeltaFrameEncoder::DeltaFrameEncoder(int threshold_percent)
    : m_threshold(std::clamp(threshold_percent, 0, 100)) {}

EncodeResult DeltaFrameEncoder::encode(ScreenFrame frame) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (frame.frame_id.empty()) {
        frame.frame_id = generate_id();
    }
    frame.is_delta = false;
    frame.reference_frame_id.reset();
    frame.regions.clear();

    const size_t original_size = frame.data.size();

    if (frame.format != PixelFormat::RAW) {
        // Compressed payloads cannot be diffed
        m_has_reference = false;
        m_reference.clear();
        record(original_size, original_size, false);
        return EncodeResult{std::move(frame), false};
    }

    const size_t expected = static_cast<size_t>(std::max(frame.width, 0)) *
                            static_cast<size_t>(std::max(frame.height, 0)) * BYTES_PER_PIXEL;
    if (frame.width <= 0 || frame.height <= 0 || frame.data.size() != expected) {
        LOG_WARN("Raw frame %dx%d carries %zu bytes (expected %zu), sending in full",
                 frame.width, frame.height, frame.data.size(), expected);
        m_has_reference = false;
        m_reference.clear();
        record(original_size, original_size, false);
        return EncodeResult{std::move(frame), false};
    }

    if (!m_has_reference || m_reference_width != frame.width || m_reference_height != frame.height) {
        store_reference(frame);
        record(original_size, original_size, false);
        return EncodeResult{std::move(frame), false};
    }

    std::vector<DeltaRegion> regions = changed_regions(frame.data, frame.width, frame.height);

    int64_t changed_pixels = 0;
    for (const auto& r : regions) {
        changed_pixels += static_cast<int64_t>(r.width) * r.height;
    }
    const int64_t total_pixels = static_cast<int64_t>(frame.width) * frame.height;
    const double changed_percent = changed_pixels * 100.0 / static_cast<double>(total_pixels);

    if (changed_percent > m_threshold) {
        LOG_DEBUG("%.1f%% of frame changed, sending full frame", changed_percent);
        store_reference(frame);
        record(original_size, original_size, false);
        return EncodeResult{std::move(frame), false};
    }

    // Pack region rows back to back in region order
    size_t total = 0;
    for (const auto& r : regions) {
        total += r.data_length;
    }

    std::vector<uint8_t> packed(total);
    const size_t stride = static_cast<size_t>(frame.width) * BYTES_PER_PIXEL;
    size_t offset = 0;
    for (auto& r : regions) {
        r.data_offset = static_cast<uint32_t>(offset);
        const size_t row_bytes = static_cast<size_t>(r.width) * BYTES_PER_PIXEL;
        for (int dy = 0; dy < r.height; dy++) {
            const size_t src = static_cast<size_t>(r.y + dy) * stride + static_cast<size_t>(r.x) * BYTES_PER_PIXEL;
            memcpy(packed.data() + offset, frame.data.data() + src, row_bytes);
            offset += row_bytes;
        }
    }

    ScreenFrame delta;
    delta.frame_id = frame.frame_id;
    delta.timestamp = frame.timestamp;
    delta.width = frame.width;
    delta.height = frame.height;
    delta.format = frame.format;
    delta.quality = frame.quality;
    delta.is_delta = true;
    delta.reference_frame_id = m_reference_id;
    delta.regions = std::move(regions);
    delta.data = std::move(packed);

    store_reference(frame);
    record(original_size, delta.data.size(), true);
    return EncodeResult{std::move(delta), true};
}

void DeltaFrameEncoder::set_delta_threshold(int percent) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_threshold = std::clamp(percent, 0, 100);
}

int DeltaFrameEncoder::delta_threshold() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threshold;
}

void DeltaFrameEncoder::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_has_reference = false;
    m_reference.clear();
    m_reference_id.clear();
    m_reference_width = 0;
    m_reference_height = 0;
}

DeltaEncoderStats DeltaFrameEncoder::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

std::vector<DeltaRegion> DeltaFrameEncoder::changed_regions(const std::vector<uint8_t>& current,
                                                            int width, int height) const {
    const int cols = (width + BLOCK_SIZE - 1) / BLOCK_SIZE;
    const int rows = (height + BLOCK_SIZE - 1) / BLOCK_SIZE;

    // Open rectangles keyed by block column span, in block units:
    // {first_col, end_col} -> {first_row, end_row}
    std::map<std::pair<int, int>, std::pair<int, int>> open;
    std::vector<std::pair<std::pair<int, int>, std::pair<int, int>>> closed;

    for (int by = 0; by < rows; by++) {
        const int y = by * BLOCK_SIZE;
        const int h = std::min(BLOCK_SIZE, height - y);

        std::map<std::pair<int, int>, std::pair<int, int>> next;
        int bx = 0;
        while (bx < cols) {
            const int x = bx * BLOCK_SIZE;
            if (!block_changed(current, x, y, std::min(BLOCK_SIZE, width - x), h, width)) {
                bx++;
                continue;
            }

            int end = bx + 1;
            while (end < cols &&
                   block_changed(current, end * BLOCK_SIZE, y,
                                 std::min(BLOCK_SIZE, width - end * BLOCK_SIZE), h, width)) {
                end++;
            }

            const auto span = std::make_pair(bx, end);
            auto it = open.find(span);
            if (it != open.end()) {
                next[span] = std::make_pair(it->second.first, by + 1);
                open.erase(it);
            } else {
                next[span] = std::make_pair(by, by + 1);
            }
            bx = end;
        }

        for (const auto& entry : open) {
            closed.emplace_back(entry.first, entry.second);
        }
        open = std::move(next);
    }
    for (const auto& entry : open) {
        closed.emplace_back(entry.first, entry.second);
    }

    std::vector<DeltaRegion> regions;
    regions.reserve(closed.size());
    for (const auto& rect : closed) {
        DeltaRegion r;
        r.x = rect.first.first * BLOCK_SIZE;
        r.y = rect.second.first * BLOCK_SIZE;
        r.width = std::min(rect.first.second * BLOCK_SIZE, width) - r.x;
        r.height = std::min(rect.second.second * BLOCK_SIZE, height) - r.y;
        r.data_length = static_cast<uint32_t>(static_cast<size_t>(r.width) * r.height * BYTES_PER_PIXEL);
        regions.push_back(r);
    }

    std::sort(regions.begin(), regions.end(), [](const DeltaRegion& a, const DeltaRegion& b) {
        return a.y != b.y ? a.y < b.y : a.x < b.x;
    });
    return regions;
}

bool DeltaFrameEncoder::block_changed(const std::vector<uint8_t>& current,
                                      int x, int y, int w, int h, int width) const {
    const size_t stride = static_cast<size_t>(width) * BYTES_PER_PIXEL;
    const size_t row_bytes = static_cast<size_t>(w) * BYTES_PER_PIXEL;

    for (int dy = 0; dy < h; dy++) {
        const size_t offset = static_cast<size_t>(y + dy) * stride + static_cast<size_t>(x) * BYTES_PER_PIXEL;
        if (memcmp(m_reference.data() + offset, current.data() + offset, row_bytes) != 0) {
            return true;
        }
    }
    return false;
}

void DeltaFrameEncoder::store_reference(const ScreenFrame& frame) {
    m_reference = frame.data;
    m_reference_id = frame.frame_id;
    m_reference_width = frame.width;
    m_reference_height = frame.height;
    m_has_reference = true;
}

void DeltaFrameEncoder::record(size_t original, size_t encoded, bool is_delta) {
    m_stats.total_frames++;
    if (is_delta) {
        m_stats.delta_frames++;
        m_stats.bytes_saved += static_cast<int64_t>(original) - static_cast<int64_t>(encoded);
    } else {
        m_stats.full_frames++;
    }

    const double ratio = original > 0 ? static_cast<double>(encoded) / static_cast<double>(original) : 1.0;
    m_stats.average_compression_ratio +=
        (ratio - m_stats.average_compression_ratio) / static_cast<double>(m_stats.total_frames);
}

}  // namespace deskstream

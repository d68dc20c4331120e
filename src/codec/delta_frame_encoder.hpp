#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "../protocol/messages.hpp"

namespace deskstream {

struct DeltaEncoderStats {
    int64_t total_frames = 0;
    int64_t delta_frames = 0;
    int64_t full_frames = 0;
    int64_t bytes_saved = 0;
    double average_compression_ratio = 0.0;  // encoded / original, averaged per frame
};

struct EncodeResult {
    ScreenFrame frame;
    bool is_delta = false;
};

// Block-diff encoder for raw BGRA frames.
//
// The frame is split into BLOCK_SIZE x BLOCK_SIZE blocks (edge blocks are
// clipped). A block is changed if any byte differs from the reference. Changed
// blocks are merged into rectangles: horizontal runs within a block row first,
// then runs with the same column span in consecutive rows are stacked. If the
// changed area exceeds the threshold a full frame is sent instead.
class DeltaFrameEncoder {
public:
    static constexpr int DEFAULT_THRESHOLD = 30;

    explicit DeltaFrameEncoder(int threshold_percent = DEFAULT_THRESHOLD);

    // Every call replaces the reference with this frame (Raw only)
    EncodeResult encode(ScreenFrame frame);

    // Clamped to [0, 100]
    void set_delta_threshold(int percent);
    int delta_threshold() const;

    // Drop the reference; the next frame is sent in full
    void reset();

    DeltaEncoderStats stats() const;

private:
    std::vector<DeltaRegion> changed_regions(const std::vector<uint8_t>& current, int width, int height) const;
    bool block_changed(const std::vector<uint8_t>& current, int x, int y, int w, int h, int width) const;
    void store_reference(const ScreenFrame& frame);
    void record(size_t original, size_t encoded, bool is_delta);

    mutable std::mutex m_mutex;
    int m_threshold;

    bool m_has_reference = false;
    std::vector<uint8_t> m_reference;
    std::string m_reference_id;
    int m_reference_width = 0;
    int m_reference_height = 0;

    DeltaEncoderStats m_stats;
};

}  // namespace deskstream

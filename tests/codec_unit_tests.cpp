#include <cstdint>
#include <iostream>
#include <set>
#include <utility>
#include <vector>

#include "capture/test_pattern_capture.hpp"
#include "codec/delta_frame_decoder.hpp"
#include "codec/delta_frame_encoder.hpp"
#include "deskstream/config.hpp"
#include "protocol/message_codec.hpp"

using deskstream::BLOCK_SIZE;
using deskstream::BYTES_PER_PIXEL;
using deskstream::DeltaFrameDecoder;
using deskstream::DeltaFrameEncoder;
using deskstream::DeltaRegion;
using deskstream::EncodeResult;
using deskstream::PixelFormat;
using deskstream::ScreenFrame;

namespace {

int fail(const char* name, const char* msg) {
    std::cerr << "[FAIL] " << name << ": " << msg << '\n';
    return 1;
}

ScreenFrame make_frame(int width, int height, uint8_t seed = 0) {
    ScreenFrame frame;
    frame.width = width;
    frame.height = height;
    frame.format = PixelFormat::RAW;
    frame.data.resize(static_cast<size_t>(width) * height * BYTES_PER_PIXEL);
    for (size_t i = 0; i < frame.data.size(); i++) {
        frame.data[i] = static_cast<uint8_t>((i * 7 + seed) & 0xFF);
    }
    return frame;
}

// Flip one pixel byte inside the given block
void touch_block(ScreenFrame& frame, int bx, int by) {
    const int x = bx * BLOCK_SIZE;
    const int y = by * BLOCK_SIZE;
    const size_t offset = (static_cast<size_t>(y) * frame.width + x) * BYTES_PER_PIXEL;
    frame.data[offset] ^= 0xFF;
}

void fill_rect(ScreenFrame& frame, int x, int y, int w, int h, uint8_t value) {
    for (int row = y; row < y + h; row++) {
        for (int col = x; col < x + w; col++) {
            const size_t offset = (static_cast<size_t>(row) * frame.width + col) * BYTES_PER_PIXEL;
            for (int c = 0; c < BYTES_PER_PIXEL; c++) {
                frame.data[offset + c] = static_cast<uint8_t>(frame.data[offset + c] ^ value);
            }
        }
    }
}

std::set<std::pair<int, int>> covered_blocks(const std::vector<DeltaRegion>& regions) {
    std::set<std::pair<int, int>> blocks;
    for (const auto& r : regions) {
        for (int y = r.y; y < r.y + r.height; y += BLOCK_SIZE) {
            for (int x = r.x; x < r.x + r.width; x += BLOCK_SIZE) {
                blocks.insert({x / BLOCK_SIZE, y / BLOCK_SIZE});
            }
        }
    }
    return blocks;
}

int test_single_block_change_is_one_region() {
    DeltaFrameEncoder encoder;
    ScreenFrame first = make_frame(300, 300);
    ScreenFrame second = first;
    fill_rect(second, 64, 64, 64, 64, 0x5A);

    const EncodeResult full = encoder.encode(first);
    if (full.is_delta || full.frame.is_delta) {
        return fail("test_single_block_change_is_one_region", "first frame should be full");
    }

    const EncodeResult delta = encoder.encode(second);
    if (!delta.is_delta || !delta.frame.is_delta) {
        return fail("test_single_block_change_is_one_region", "second frame should be a delta");
    }
    if (!delta.frame.reference_frame_id || *delta.frame.reference_frame_id != full.frame.frame_id) {
        return fail("test_single_block_change_is_one_region", "delta does not reference the first frame");
    }
    if (delta.frame.regions.size() != 1) {
        return fail("test_single_block_change_is_one_region", "expected exactly one region");
    }
    const DeltaRegion& r = delta.frame.regions[0];
    if (r.x != 64 || r.y != 64 || r.width != 64 || r.height != 64) {
        return fail("test_single_block_change_is_one_region", "region does not cover the changed block");
    }
    if (delta.frame.data.size() >= second.data.size() || r.data_length != 64u * 64u * BYTES_PER_PIXEL) {
        return fail("test_single_block_change_is_one_region", "delta payload not smaller than full frame");
    }
    if (!deskstream::validate_screen_frame(delta.frame)) {
        return fail("test_single_block_change_is_one_region", "delta frame fails validation");
    }
    return 0;
}

int test_regions_cover_exactly_changed_blocks() {
    DeltaFrameEncoder encoder(100);
    ScreenFrame base = make_frame(640, 480, 3);
    encoder.encode(base);

    // L-shape, a lone block, a full row run and a clipped edge block
    const std::vector<std::pair<int, int>> changed = {
        {0, 0}, {1, 0}, {0, 1}, {1, 1}, {0, 2},
        {5, 1},
        {3, 4}, {4, 4}, {5, 4}, {6, 4},
        {9, 7},
    };
    ScreenFrame next = base;
    for (const auto& b : changed) {
        touch_block(next, b.first, b.second);
    }

    const EncodeResult result = encoder.encode(next);
    if (!result.is_delta) {
        return fail("test_regions_cover_exactly_changed_blocks", "expected a delta");
    }

    const std::set<std::pair<int, int>> expected(changed.begin(), changed.end());
    if (covered_blocks(result.frame.regions) != expected) {
        return fail("test_regions_cover_exactly_changed_blocks", "region union differs from changed blocks");
    }

    size_t area = 0;
    for (const auto& r : result.frame.regions) {
        area += static_cast<size_t>(r.width) * r.height;
    }
    // 10 interior blocks plus the 64x32 bottom edge block
    if (area != 10u * 64u * 64u + 64u * 32u) {
        return fail("test_regions_cover_exactly_changed_blocks", "regions overlap or overreach");
    }
    if (result.frame.regions.size() >= changed.size()) {
        return fail("test_regions_cover_exactly_changed_blocks", "adjacent blocks were not merged");
    }
    if (!deskstream::validate_screen_frame(result.frame)) {
        return fail("test_regions_cover_exactly_changed_blocks", "regions unsorted or overlapping");
    }
    return 0;
}

int test_full_frame_cases() {
    DeltaFrameEncoder encoder;

    // No reference yet
    if (encoder.encode(make_frame(128, 128)).is_delta) {
        return fail("test_full_frame_cases", "first frame encoded as delta");
    }

    // Dimension change
    if (encoder.encode(make_frame(192, 128)).is_delta) {
        return fail("test_full_frame_cases", "resolution change encoded as delta");
    }

    // Non-raw payloads are never diffed, and clear the reference
    ScreenFrame jpeg;
    jpeg.width = 192;
    jpeg.height = 128;
    jpeg.format = PixelFormat::JPEG;
    jpeg.data = {0xFF, 0xD8, 0xFF, 0xD9};
    if (encoder.encode(jpeg).is_delta || encoder.encode(jpeg).is_delta) {
        return fail("test_full_frame_cases", "jpeg frame encoded as delta");
    }
    if (encoder.encode(make_frame(192, 128)).is_delta) {
        return fail("test_full_frame_cases", "raw frame after jpeg encoded as delta");
    }

    // Above threshold
    ScreenFrame changed = make_frame(192, 128, 9);
    if (encoder.encode(changed).is_delta) {
        return fail("test_full_frame_cases", "fully changed frame encoded as delta");
    }

    // Reset drops the reference
    encoder.reset();
    if (encoder.encode(changed).is_delta) {
        return fail("test_full_frame_cases", "frame after reset encoded as delta");
    }

    // Payload that does not match the dimensions
    ScreenFrame short_frame = make_frame(192, 128);
    short_frame.data.resize(100);
    if (encoder.encode(short_frame).is_delta) {
        return fail("test_full_frame_cases", "malformed raw frame encoded as delta");
    }
    return 0;
}

int test_identical_frames_give_empty_delta() {
    DeltaFrameEncoder encoder;
    ScreenFrame frame = make_frame(200, 100);
    encoder.encode(frame);

    const EncodeResult result = encoder.encode(frame);
    if (!result.is_delta || !result.frame.regions.empty() || !result.frame.data.empty()) {
        return fail("test_identical_frames_give_empty_delta", "identical frame not an empty delta");
    }
    if (!deskstream::validate_screen_frame(result.frame)) {
        return fail("test_identical_frames_give_empty_delta", "empty delta fails validation");
    }
    return 0;
}

int test_decoder_reproduces_frames() {
    DeltaFrameEncoder encoder;
    DeltaFrameDecoder decoder;

    ScreenFrame frame = make_frame(300, 200, 1);
    for (int step = 0; step < 6; step++) {
        if (step > 0) {
            touch_block(frame, step % 5, step % 4);
            fill_rect(frame, 256, 192, 44, 8, static_cast<uint8_t>(step));
        }
        ScreenFrame input = frame;
        input.frame_id.clear();

        const EncodeResult result = encoder.encode(input);
        if (step > 0 && !result.is_delta) {
            return fail("test_decoder_reproduces_frames", "small change not encoded as delta");
        }
        if (!decoder.apply(result.frame)) {
            return fail("test_decoder_reproduces_frames", "decoder rejected a valid frame");
        }
        if (decoder.current().data != frame.data) {
            return fail("test_decoder_reproduces_frames", "reconstruction differs from source");
        }
        if (decoder.current().is_delta || !decoder.current().regions.empty()) {
            return fail("test_decoder_reproduces_frames", "reconstruction is not a full frame");
        }
    }
    return 0;
}

int test_decoder_rejects_wrong_reference() {
    DeltaFrameEncoder encoder;
    DeltaFrameDecoder decoder;

    ScreenFrame a = make_frame(128, 128);
    ScreenFrame b = a;
    touch_block(b, 1, 1);
    ScreenFrame c = b;
    touch_block(c, 0, 0);

    const EncodeResult ra = encoder.encode(a);
    const EncodeResult rb = encoder.encode(b);
    const EncodeResult rc = encoder.encode(c);

    if (decoder.apply(rb.frame)) {
        return fail("test_decoder_rejects_wrong_reference", "delta applied without a reference");
    }
    decoder.apply(ra.frame);
    if (decoder.apply(rc.frame)) {
        return fail("test_decoder_rejects_wrong_reference", "delta applied to the wrong reference");
    }
    if (decoder.current().data != a.data) {
        return fail("test_decoder_rejects_wrong_reference", "rejected delta modified the reconstruction");
    }
    if (!decoder.apply(rb.frame) || !decoder.apply(rc.frame) || decoder.current().data != c.data) {
        return fail("test_decoder_rejects_wrong_reference", "in-order deltas not applied");
    }
    return 0;
}

int test_threshold_clamp_and_stats() {
    DeltaFrameEncoder encoder;
    encoder.set_delta_threshold(150);
    if (encoder.delta_threshold() != 100) {
        return fail("test_threshold_clamp_and_stats", "threshold not clamped to 100");
    }
    encoder.set_delta_threshold(-5);
    if (encoder.delta_threshold() != 0) {
        return fail("test_threshold_clamp_and_stats", "threshold not clamped to 0");
    }

    // Zero threshold: any change forces a full frame, no change still deltas
    ScreenFrame frame = make_frame(128, 128);
    encoder.encode(frame);
    if (!encoder.encode(frame).is_delta) {
        return fail("test_threshold_clamp_and_stats", "unchanged frame not a delta at threshold 0");
    }
    touch_block(frame, 0, 0);
    if (encoder.encode(frame).is_delta) {
        return fail("test_threshold_clamp_and_stats", "changed frame sent as delta at threshold 0");
    }

    const auto stats = encoder.stats();
    if (stats.total_frames != 3 || stats.delta_frames != 1 || stats.full_frames != 2) {
        return fail("test_threshold_clamp_and_stats", "frame counters wrong");
    }
    if (stats.bytes_saved != static_cast<int64_t>(frame.data.size())) {
        return fail("test_threshold_clamp_and_stats", "bytes_saved should equal one full frame");
    }
    if (stats.average_compression_ratio <= 0.0 || stats.average_compression_ratio >= 1.0) {
        return fail("test_threshold_clamp_and_stats", "compression ratio out of range");
    }
    return 0;
}

int test_pattern_capture_streams_as_deltas() {
    const char* name = "test_pattern_capture_streams_as_deltas";

    deskstream::TestPatternCapture capture;
    if (capture.init(10, 10) || capture.is_initialized()) {
        return fail(name, "undersized capture accepted");
    }
    if (!capture.init(320, 240) || !capture.is_initialized()) {
        return fail(name, "capture init failed");
    }
    capture.set_quality(60);
    if (capture.quality() != 60) {
        return fail(name, "quality not stored");
    }

    DeltaFrameEncoder encoder;
    DeltaFrameDecoder decoder;
    ScreenFrame last;
    for (int i = 0; i < 3; i++) {
        ScreenFrame frame;
        if (!capture.capture_frame(frame)) {
            return fail(name, "capture failed");
        }
        last = frame;
        EncodeResult result = encoder.encode(std::move(frame));
        if (result.is_delta != (i > 0)) {
            return fail(name, "only the first frame should be full");
        }
        if (i > 0 && result.frame.regions.empty()) {
            return fail(name, "moving box produced no regions");
        }
        if (!decoder.apply(result.frame)) {
            return fail(name, "decoder rejected a captured frame");
        }
    }

    if (!decoder.has_frame() || decoder.current().data != last.data) {
        return fail(name, "reconstruction differs from capture");
    }
    if (capture.frames_captured() != 3) {
        return fail(name, "frame counter wrong");
    }

    capture.shutdown();
    ScreenFrame after;
    if (capture.capture_frame(after)) {
        return fail(name, "capture after shutdown succeeded");
    }
    return 0;
}

}  // namespace

int main() {
    if (int rc = test_single_block_change_is_one_region(); rc != 0) {
        return rc;
    }
    if (int rc = test_regions_cover_exactly_changed_blocks(); rc != 0) {
        return rc;
    }
    if (int rc = test_full_frame_cases(); rc != 0) {
        return rc;
    }
    if (int rc = test_identical_frames_give_empty_delta(); rc != 0) {
        return rc;
    }
    if (int rc = test_decoder_reproduces_frames(); rc != 0) {
        return rc;
    }
    if (int rc = test_decoder_rejects_wrong_reference(); rc != 0) {
        return rc;
    }
    if (int rc = test_threshold_clamp_and_stats(); rc != 0) {
        return rc;
    }
    if (int rc = test_pattern_capture_streams_as_deltas(); rc != 0) {
        return rc;
    }

    std::cout << "[PASS] codec unit tests\n";
    return 0;
}

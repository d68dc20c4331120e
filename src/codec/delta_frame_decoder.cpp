#include "delta_frame_decoder.hpp"
#include "../protocol/message_codec.hpp"
#include "../util/logger.hpp"
#include "deskstream/config.hpp"
#include <cstring>

namespace deskstream {

bool DeltaFrameDecoder::apply(const ScreenFrame& frame) {
    if (!frame.is_delta) {
        m_current = frame;
        m_current.reference_frame_id.reset();
        m_current.regions.clear();
        m_has_frame = true;
        return true;
    }

    if (!m_has_frame || m_current.format != PixelFormat::RAW) {
        LOG_WARN("Delta frame %s has no usable reference", frame.frame_id.c_str());
        return false;
    }
    if (!frame.reference_frame_id || *frame.reference_frame_id != m_current.frame_id) {
        LOG_WARN("Delta frame %s references %s, have %s", frame.frame_id.c_str(),
                 frame.reference_frame_id ? frame.reference_frame_id->c_str() : "(none)",
                 m_current.frame_id.c_str());
        return false;
    }
    if (frame.width != m_current.width || frame.height != m_current.height) {
        LOG_WARN("Delta frame %s is %dx%d, reference is %dx%d", frame.frame_id.c_str(),
                 frame.width, frame.height, m_current.width, m_current.height);
        return false;
    }
    if (!validate_screen_frame(frame)) {
        LOG_WARN("Delta frame %s has invalid regions", frame.frame_id.c_str());
        return false;
    }

    const size_t stride = static_cast<size_t>(m_current.width) * BYTES_PER_PIXEL;
    if (m_current.data.size() != stride * static_cast<size_t>(m_current.height)) {
        LOG_WARN("Reference frame %s has a short payload", m_current.frame_id.c_str());
        return false;
    }

    for (const auto& r : frame.regions) {
        const size_t row_bytes = static_cast<size_t>(r.width) * BYTES_PER_PIXEL;
        size_t src = r.data_offset;
        for (int dy = 0; dy < r.height; dy++) {
            const size_t dst = static_cast<size_t>(r.y + dy) * stride + static_cast<size_t>(r.x) * BYTES_PER_PIXEL;
            memcpy(m_current.data.data() + dst, frame.data.data() + src, row_bytes);
            src += row_bytes;
        }
    }

    m_current.frame_id = frame.frame_id;
    m_current.timestamp = frame.timestamp;
    m_current.quality = frame.quality;
    return true;
}

void DeltaFrameDecoder::reset() {
    m_current = ScreenFrame{};
    m_has_frame = false;
}

}  // namespace deskstream

#include "test_pattern_capture.hpp"
#include "deskstream/config.hpp"
#include "../util/logger.hpp"
#include <algorithm>

namespace deskstream {

TestPatternCapture::TestPatternCapture(const Clock& clock) : m_clock(clock) {}

TestPatternCapture::~TestPatternCapture() {
    shutdown();
}

bool TestPatternCapture::init(int width, int height) {
    constexpr int min_edge = BOX_SIZE + BOX_STEP;
    if (width < min_edge || height < min_edge) {
        LOG_ERROR("Test pattern needs at least %dx%d, got %dx%d", min_edge, min_edge, width, height);
        return false;
    }

    m_width = width;
    m_height = height;
    m_box_x = 0;
    m_box_y = 0;
    m_dx = BOX_STEP;
    m_dy = BOX_STEP / 2;
    m_frame_count = 0;
    draw_background();

    m_initialized = true;
    LOG_INFO("Test pattern capture initialized: %dx%d", m_width, m_height);
    return true;
}

void TestPatternCapture::shutdown() {
    if (!m_initialized) return;
    m_background.clear();
    m_background.shrink_to_fit();
    m_initialized = false;
}

void TestPatternCapture::draw_background() {
    m_background.assign(static_cast<size_t>(m_width) * m_height * BYTES_PER_PIXEL, 0);
    for (int y = 0; y < m_height; y++) {
        uint8_t* row = m_background.data() + static_cast<size_t>(y) * m_width * BYTES_PER_PIXEL;
        for (int x = 0; x < m_width; x++) {
            row[x * 4 + 0] = static_cast<uint8_t>((x * 255) / m_width);   // B
            row[x * 4 + 1] = static_cast<uint8_t>((y * 255) / m_height);  // G
            row[x * 4 + 2] = 0x40;                                        // R
            row[x * 4 + 3] = 0xFF;                                        // A
        }
    }
}

void TestPatternCapture::fill_rect(std::vector<uint8_t>& pixels, int x, int y, int w, int h,
                                   uint32_t bgra) const {
    const int x1 = std::min(x + w, m_width);
    const int y1 = std::min(y + h, m_height);
    for (int row = std::max(y, 0); row < y1; row++) {
        uint8_t* p = pixels.data() + (static_cast<size_t>(row) * m_width + std::max(x, 0)) * BYTES_PER_PIXEL;
        for (int col = std::max(x, 0); col < x1; col++) {
            p[0] = static_cast<uint8_t>(bgra);
            p[1] = static_cast<uint8_t>(bgra >> 8);
            p[2] = static_cast<uint8_t>(bgra >> 16);
            p[3] = static_cast<uint8_t>(bgra >> 24);
            p += BYTES_PER_PIXEL;
        }
    }
}

bool TestPatternCapture::capture_frame(ScreenFrame& frame) {
    if (!m_initialized) return false;

    frame.data = m_background;
    frame.width = m_width;
    frame.height = m_height;
    frame.format = PixelFormat::RAW;
    frame.timestamp = m_clock.now();
    frame.is_delta = false;
    frame.reference_frame_id.reset();
    frame.regions.clear();

    fill_rect(frame.data, m_box_x, m_box_y, BOX_SIZE, BOX_SIZE, 0xFFFFFFFFu);

    // Bounce off the edges
    if (m_box_x + m_dx < 0 || m_box_x + m_dx + BOX_SIZE > m_width) m_dx = -m_dx;
    if (m_box_y + m_dy < 0 || m_box_y + m_dy + BOX_SIZE > m_height) m_dy = -m_dy;
    m_box_x += m_dx;
    m_box_y += m_dy;

    m_frame_count++;
    return true;
}

}  // namespace deskstream

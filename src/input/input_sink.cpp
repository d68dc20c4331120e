#include "input_sink.hpp"
#include "../util/logger.hpp"
#include <algorithm>

namespace deskstream {

const char* input_event_type_name(InputEventType type) {
    switch (type) {
        case InputEventType::MOUSE_MOVE:  return "mouse-move";
        case InputEventType::MOUSE_CLICK: return "mouse-click";
        case InputEventType::MOUSE_WHEEL: return "mouse-wheel";
        case InputEventType::KEY_PRESS:   return "key-press";
        case InputEventType::KEY_RELEASE: return "key-release";
        case InputEventType::TEXT_INPUT:  return "text-input";
    }
    return "unknown";
}

LoggingInputSink::LoggingInputSink(int screen_width, int screen_height)
    : m_screen_width(screen_width), m_screen_height(screen_height) {}

int LoggingInputSink::clamp_coord(int val, int max) const {
    return std::clamp(val, 0, std::max(max - 1, 0));
}

void LoggingInputSink::handle_input(const InputEvent& event) {
    m_events++;

    switch (event.type) {
        case InputEventType::MOUSE_MOVE:
        case InputEventType::MOUSE_CLICK:
        case InputEventType::MOUSE_WHEEL:
            LOG_DEBUG("Input %s at (%d, %d)%s", input_event_type_name(event.type),
                      clamp_coord(event.x, m_screen_width), clamp_coord(event.y, m_screen_height),
                      event.pressed ? " pressed" : "");
            break;

        case InputEventType::KEY_PRESS:
            m_keys_down++;
            LOG_DEBUG("Input key-press %s", event.key_code.c_str());
            break;

        case InputEventType::KEY_RELEASE:
            if (m_keys_down > 0) m_keys_down--;
            LOG_DEBUG("Input key-release %s", event.key_code.c_str());
            break;

        case InputEventType::TEXT_INPUT:
            LOG_DEBUG("Input text (%zu bytes)", event.text.size());
            break;
    }
}

void LoggingInputSink::reset_all() {
    if (m_keys_down > 0) {
        LOG_INFO("Releasing %d held key(s)", m_keys_down);
    }
    m_keys_down = 0;
}

void LoggingClipboardSink::handle_clipboard(const ClipboardData& data) {
    switch (data.content_type) {
        case ClipboardContentType::TEXT:
            LOG_INFO("Clipboard text received (%zu bytes)", data.text.size());
            break;
        case ClipboardContentType::IMAGE:
            LOG_INFO("Clipboard image received (%zu bytes)", data.image_data.size());
            break;
        case ClipboardContentType::NONE:
            LOG_DEBUG("Empty clipboard update ignored");
            break;
    }
}

}  // namespace deskstream

#pragma once

#include <cstdint>
#include "../protocol/messages.hpp"

namespace deskstream {

// Host-side consumer of remote input. Injection into the OS is platform
// specific; the core only routes events here.
class InputSink {
public:
    virtual ~InputSink() = default;

    virtual void handle_input(const InputEvent& event) = 0;

    // Release anything still held (call on disconnect/shutdown)
    virtual void reset_all() = 0;
};

class ClipboardSink {
public:
    virtual ~ClipboardSink() = default;

    virtual void handle_clipboard(const ClipboardData& data) = 0;
};

// Logs events with pointer coordinates clamped to the captured screen
class LoggingInputSink : public InputSink {
public:
    LoggingInputSink(int screen_width, int screen_height);

    void handle_input(const InputEvent& event) override;
    void reset_all() override;

    uint64_t events_handled() const { return m_events; }
    int keys_down() const { return m_keys_down; }

private:
    int clamp_coord(int val, int max) const;

    int m_screen_width;
    int m_screen_height;
    int m_keys_down = 0;
    uint64_t m_events = 0;
};

class LoggingClipboardSink : public ClipboardSink {
public:
    void handle_clipboard(const ClipboardData& data) override;
};

const char* input_event_type_name(InputEventType type);

}  // namespace deskstream

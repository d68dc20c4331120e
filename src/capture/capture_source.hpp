#pragma once

#include "../protocol/messages.hpp"

namespace deskstream {

// Abstract screen source. Produces full RAW (BGRA) frames; the delta codec
// decides what actually goes on the wire.
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    // Initialize the source at the requested size
    // Returns true on success
    virtual bool init(int width, int height) = 0;

    // Shutdown and cleanup resources
    virtual void shutdown() = 0;

    // Capture a frame into frame.data/width/height/timestamp
    // Returns true if a new frame was captured
    virtual bool capture_frame(ScreenFrame& frame) = 0;

    // Get screen dimensions (only valid after init)
    virtual int get_width() const = 0;
    virtual int get_height() const = 0;

    // Quality hint from the adaptive controller (30..95). Sources that do
    // not compress may ignore it.
    virtual void set_quality(int quality) = 0;

    // Check if initialized successfully
    virtual bool is_initialized() const = 0;

    // Get source name for logging
    virtual const char* get_name() const = 0;

protected:
    CaptureSource() = default;

    // Non-copyable
    CaptureSource(const CaptureSource&) = delete;
    CaptureSource& operator=(const CaptureSource&) = delete;
};

}  // namespace deskstream

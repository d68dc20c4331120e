#pragma once

#include <string>
#include "../protocol/messages.hpp"

namespace deskstream {

// Viewer-side counterpart of DeltaFrameEncoder: keeps the reconstructed
// frame and patches delta regions into it. Not thread-safe.
class DeltaFrameDecoder {
public:
    // Full frames replace the reconstruction. A delta is applied only if its
    // reference id matches the current frame and every region fits; otherwise
    // it is rejected and the reconstruction is left untouched.
    bool apply(const ScreenFrame& frame);

    bool has_frame() const { return m_has_frame; }

    // Last reconstructed frame, always a full frame
    const ScreenFrame& current() const { return m_current; }

    void reset();

private:
    ScreenFrame m_current;
    bool m_has_frame = false;
};

}  // namespace deskstream

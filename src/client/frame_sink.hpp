#pragma once

#include <chrono>
#include <string>
#include "../protocol/messages.hpp"

namespace deskstream {

// Consumer of reconstructed (always full, RAW) frames on the viewer
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Called on the channel reader thread for every reconstructed frame
    virtual void on_frame(const ScreenFrame& frame) = 0;
};

// Writes the latest frame as a binary PPM, at most once per interval.
// The file is replaced atomically so readers never see a partial image.
class PpmSnapshotSink : public FrameSink {
public:
    explicit PpmSnapshotSink(std::string path,
                             std::chrono::milliseconds min_interval = std::chrono::milliseconds(1000));

    void on_frame(const ScreenFrame& frame) override;

    int snapshots_written() const { return m_written; }

private:
    bool write_ppm(const ScreenFrame& frame) const;

    std::string m_path;
    std::chrono::milliseconds m_min_interval;
    std::chrono::steady_clock::time_point m_last_write;
    bool m_has_written = false;
    int m_written = 0;
};

}  // namespace deskstream

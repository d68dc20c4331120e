#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "deskstream/config.hpp"
#include "../capture/capture_source.hpp"
#include "../codec/delta_frame_encoder.hpp"
#include "../input/input_sink.hpp"
#include "../network/transport_channel.hpp"
#include "../pairing/pairing_gate.hpp"
#include "../quality/adaptive_quality_controller.hpp"
#include "../quality/performance_monitor.hpp"
#include "../session/session_manager.hpp"
#include "../util/clock.hpp"
#include "../util/event_loop.hpp"

namespace deskstream {

// Host side of a remote desktop session. Everything except socket I/O runs
// on the event loop thread; channel callbacks are posted onto it.
class DesktopHost {
public:
    explicit DesktopHost(std::unique_ptr<CaptureSource> capture,
                         const Clock& clock = SystemClock::instance());
    ~DesktopHost();

    DesktopHost(const DesktopHost&) = delete;
    DesktopHost& operator=(const DesktopHost&) = delete;

    // Initialize with configuration
    bool init(const HostConfig& config);

    // Run host (blocking) until stop()
    void run();

    // Stop host. Callable from any thread or a signal handler.
    void stop();

    // Replace the logging sinks (call before init)
    void set_input_sink(std::unique_ptr<InputSink> sink) { m_input = std::move(sink); }
    void set_clipboard_sink(std::unique_ptr<ClipboardSink> sink) { m_clipboard = std::move(sink); }

    uint16_t port() const;
    std::optional<std::string> current_pin() const;
    std::string tls_fingerprint() const;

    const SessionManager& sessions() const { return *m_sessions; }
    uint32_t frames_sent() const { return m_frame_count.load(); }

private:
    void register_handlers();

    void handle_channel_state(bool connected);
    void handle_pairing(const PairingRequest& request);
    bool resume_session(const PairingRequest& request);
    void accept_session(const PairingRequest& request);
    void reject_pairing(PairingFailureReason reason, const std::string& message);
    void handle_frame_ack(const FrameAck& ack);
    void handle_session_event(SessionEvent event, const RemoteSession& session);

    void start_streaming(const std::string& session_id);
    void stop_streaming();
    void capture_and_send();
    void report_quality();

    void arm_reconnect_window(const std::string& session_id);
    void cancel_reconnect_window();

    void shutdown();

    HostConfig m_config;
    const Clock& m_clock;
    EventLoop m_loop;

    std::unique_ptr<CaptureSource> m_capture;
    std::unique_ptr<InputSink> m_input;
    std::unique_ptr<ClipboardSink> m_clipboard;
    std::unique_ptr<PairingGate> m_pairing;
    std::unique_ptr<SessionManager> m_sessions;
    std::unique_ptr<DeltaFrameEncoder> m_encoder;
    std::unique_ptr<AdaptiveQualityController> m_quality;
    std::unique_ptr<PerformanceMonitor> m_monitor;
    std::unique_ptr<TransportChannel> m_channel;

    // Loop thread only
    std::string m_session_id;
    bool m_streaming = false;
    void* m_capture_timer = nullptr;
    void* m_report_timer = nullptr;
    void* m_window_timer = nullptr;
    int m_capture_fail_count = 0;
    int m_send_fail_count = 0;

    bool m_initialized = false;
    bool m_shut_down = false;
    std::atomic<uint32_t> m_frame_count{0};
};

}  // namespace deskstream

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "deskstream/config.hpp"
#include "frame_sink.hpp"
#include "../codec/delta_frame_decoder.hpp"
#include "../network/transport_channel.hpp"
#include "../session/session_manager.hpp"
#include "../util/clock.hpp"
#include "../util/event_loop.hpp"

namespace deskstream {

// Viewer side: pairs with a host, reconstructs the frame stream, acks every
// frame and keeps the session alive through bounded reconnects.
class DesktopClient {
public:
    explicit DesktopClient(const Clock& clock = SystemClock::instance());
    ~DesktopClient();

    DesktopClient(const DesktopClient&) = delete;
    DesktopClient& operator=(const DesktopClient&) = delete;

    bool init(const ClientConfig& config);

    // Install a frame consumer (call before connect)
    void set_frame_sink(std::unique_ptr<FrameSink> sink) { m_sink = std::move(sink); }

    // Connect and pair. Blocks for at most the connect, handshake and
    // pairing timeouts. Call before run().
    bool connect(const DeviceInfo& host, const std::string& pin);
    bool connect(const std::string& address, uint16_t port, const std::string& pin);

    // Run event loop (blocking) until stop() or reconnects run out
    void run();

    // Callable from any thread or a signal handler
    void stop();

    bool send_input(const InputEvent& event);
    bool send_clipboard(const ClipboardData& data);

    bool is_paired() const { return m_paired.load(); }
    std::string session_token() const;
    std::optional<PairingResponse> last_pairing_response() const;
    std::optional<ConnectionQuality> last_quality() const;

    uint64_t frames_received() const { return m_frames_received.load(); }
    uint64_t frames_rejected() const { return m_frames_rejected.load(); }

    const SessionManager& sessions() const { return *m_sessions; }

private:
    void register_handlers();
    bool pair(const std::string& pin, const std::string& token);
    void reset_decoder();

    // Reader thread
    void handle_screen_frame(const ScreenFrame& frame);
    void handle_pairing_response(const PairingResponse& response);

    // Loop thread
    void handle_channel_state(bool connected);
    void handle_session_event(SessionEvent event, const RemoteSession& session);
    void schedule_reconnect();
    void attempt_reconnect();

    void shutdown();

    ClientConfig m_config;
    const Clock& m_clock;
    EventLoop m_loop;

    std::unique_ptr<SessionManager> m_sessions;
    std::unique_ptr<FrameSink> m_sink;
    std::unique_ptr<TransportChannel> m_channel;

    // Where to reconnect
    std::string m_address;
    uint16_t m_port = 0;
    std::string m_host_id;
    std::string m_host_name;
    std::string m_session_id;

    // Pairing handshake
    mutable std::mutex m_pair_mutex;
    std::condition_variable m_pair_cv;
    std::optional<PairingResponse> m_pending_response;
    std::optional<PairingResponse> m_last_response;
    std::string m_token;
    std::atomic<bool> m_paired{false};

    std::mutex m_decoder_mutex;
    DeltaFrameDecoder m_decoder;
    bool m_need_full_frame = false;
    std::atomic<uint64_t> m_frames_received{0};
    std::atomic<uint64_t> m_frames_rejected{0};

    mutable std::mutex m_quality_mutex;
    std::optional<ConnectionQuality> m_last_quality;

    void* m_reconnect_timer = nullptr;
    std::atomic<bool> m_stopping{false};
    bool m_initialized = false;
    bool m_shut_down = false;
};

}  // namespace deskstream

#include "desktop_host.hpp"
#include "../util/hostname.hpp"
#include "../util/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace deskstream {

DesktopHost::DesktopHost(std::unique_ptr<CaptureSource> capture, const Clock& clock)
    : m_clock(clock), m_capture(std::move(capture)) {}

DesktopHost::~DesktopHost() {
    shutdown();
}

bool DesktopHost::init(const HostConfig& config) {
    m_config = config;
    if (m_config.host_id.empty()) {
        m_config.host_id = local_hostname();
    }
    if (m_config.host_name.empty()) {
        m_config.host_name = m_config.host_id;
    }

    // Initialize capture source
    if (!m_capture || !m_capture->init(config.capture_width, config.capture_height)) {
        LOG_ERROR("Failed to initialize capture source");
        return false;
    }
    LOG_INFO("Using %s capture source", m_capture->get_name());

    if (!m_input) {
        m_input = std::make_unique<LoggingInputSink>(m_capture->get_width(), m_capture->get_height());
    }
    if (!m_clipboard) {
        m_clipboard = std::make_unique<LoggingClipboardSink>();
    }

    if (!m_loop.init()) {
        LOG_ERROR("Failed to initialize event loop");
        return false;
    }

    try {
        m_pairing = std::make_unique<PairingGate>(m_clock, std::chrono::seconds(config.pin_ttl_seconds),
                                                  config.max_pin_attempts);
        m_sessions = std::make_unique<SessionManager>(m_clock, config.max_reconnect_attempts);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid host configuration: %s", e.what());
        return false;
    }

    m_encoder = std::make_unique<DeltaFrameEncoder>(config.delta_threshold);
    m_quality = std::make_unique<AdaptiveQualityController>(m_clock);
    m_monitor = std::make_unique<PerformanceMonitor>(m_clock);
    m_channel = std::make_unique<TransportChannel>(config.transport);

    register_handlers();

    if (!m_channel->start(config.port)) {
        LOG_ERROR("Failed to start transport on port %u", config.port);
        return false;
    }

    m_pairing->generate_pin();

    const uint64_t report_ms = static_cast<uint64_t>(std::max(config.quality_report_interval_ms, 100));
    m_report_timer = m_loop.add_timer(report_ms, report_ms, [this]() { report_quality(); });

    m_initialized = true;
    LOG_INFO("Host initialized: %dx%d on port %u (TLS %s)",
             m_capture->get_width(), m_capture->get_height(), m_channel->local_port(),
             config.transport.tls.enabled ? "on" : "off");
    return true;
}

void DesktopHost::register_handlers() {
    m_pairing->on_pin_generated([this](const std::string& pin) {
        printf("Pairing PIN: %s (valid for %d s)\n", pin.c_str(), m_config.pin_ttl_seconds);
        fflush(stdout);
    });

    m_pairing->on_pairing_attempted([this](const PairingAttemptResult& result) {
        if (!result.success) {
            printf("Pairing attempt failed: %s (%d attempts left)\n",
                   pairing_failure_name(result.reason), m_pairing->attempts_remaining());
            fflush(stdout);
        }
    });

    // Session events are raised from loop-thread calls only
    m_sessions->on_event([this](SessionEvent event, const RemoteSession& session) {
        handle_session_event(event, session);
    });

    m_channel->on_connection_state([this](bool connected) {
        m_loop.post([this, connected]() { handle_channel_state(connected); });
    });

    m_channel->subscribe<PairingRequest>([this](const PairingRequest& request) {
        m_loop.post([this, request]() { handle_pairing(request); });
    });

    m_channel->subscribe<FrameAck>([this](const FrameAck& ack) {
        m_loop.post([this, ack]() { handle_frame_ack(ack); });
    });

    m_channel->subscribe<InputEvent>([this](const InputEvent& event) {
        m_loop.post([this, event]() {
            if (m_streaming) {
                m_input->handle_input(event);
            }
        });
    });

    m_channel->subscribe<ClipboardData>([this](const ClipboardData& data) {
        m_loop.post([this, data]() {
            if (m_streaming) {
                m_clipboard->handle_clipboard(data);
            }
        });
    });

    m_channel->subscribe<ChatMessage>([](const ChatMessage& message) {
        LOG_INFO("Chat from %s: %s", message.sender_name.c_str(), message.text.c_str());
    });

    m_channel->subscribe<FileTransferRequest>([this](const FileTransferRequest& request) {
        m_loop.post([this, request]() {
            FileTransferResponse response;
            response.transfer_id = request.transfer_id;
            response.accepted = false;
            response.rejection = FileTransferRejection::USER_DECLINED;
            response.message = "File transfer is not enabled on this host";
            if (!m_channel->send(response)) {
                LOG_WARN("Failed to decline file transfer %s", request.transfer_id.c_str());
            }
        });
    });
}

void DesktopHost::run() {
    if (!m_initialized) {
        LOG_ERROR("Host not initialized");
        return;
    }

    LOG_INFO("Waiting for viewer on port %u...", m_channel->local_port());
    m_loop.run();

    shutdown();
    LOG_INFO("Host stopped");
}

void DesktopHost::stop() {
    m_loop.stop();
}

uint16_t DesktopHost::port() const {
    return m_channel ? m_channel->local_port() : 0;
}

std::optional<std::string> DesktopHost::current_pin() const {
    return m_pairing ? m_pairing->current_pin() : std::nullopt;
}

std::string DesktopHost::tls_fingerprint() const {
    return m_channel ? m_channel->tls_fingerprint() : std::string();
}

void DesktopHost::handle_channel_state(bool connected) {
    if (connected) {
        printf("Client connected from %s - awaiting pairing\n", m_channel->peer_address().c_str());
        fflush(stdout);
        return;
    }

    if (!m_streaming) {
        LOG_INFO("Unpaired client disconnected");
        return;
    }

    const std::string session_id = m_session_id;
    stop_streaming();
    m_input->reset_all();
    m_sessions->on_disconnected(session_id, "channel closed");

    printf("Client disconnected - holding session for %d ms\n", m_config.reconnect_window_ms);
    fflush(stdout);
    arm_reconnect_window(session_id);
}

void DesktopHost::handle_pairing(const PairingRequest& request) {
    if (!m_channel->is_connected()) {
        return;
    }

    LOG_INFO("Pairing request from %s (%s)", request.client_name.c_str(), request.client_id.c_str());

    if (!request.session_token.empty()) {
        if (resume_session(request)) {
            return;
        }
        if (request.pin.empty()) {
            reject_pairing(PairingFailureReason::HOST_REFUSED, "Session cannot be resumed");
            return;
        }
    }

    const PairingAttemptResult result = m_pairing->attempt_pin(request.pin);
    if (!result.success) {
        reject_pairing(result.reason, pairing_failure_name(result.reason));
        return;
    }

    accept_session(request);
}

// Returns false when the token does not name a resumable session, in which
// case a PIN in the same request is tried instead.
bool DesktopHost::resume_session(const PairingRequest& request) {
    auto session = m_sessions->find_session(request.session_token);
    if (!session || session->client_id != request.client_id || session->is_terminal() ||
        session->status == SessionStatus::CONNECTED) {
        LOG_WARN("Session token from %s not resumable", request.client_id.c_str());
        return false;
    }

    const std::string session_id = session->session_id;
    if (!m_sessions->try_reconnect(session_id)) {
        reject_pairing(PairingFailureReason::HOST_REFUSED, "Reconnect attempts exhausted");
        return true;
    }
    m_sessions->on_connected(session_id);

    PairingResponse response;
    response.success = true;
    response.session_token = session_id;
    response.message = "Session resumed";
    if (!m_channel->send(response)) {
        LOG_WARN("Failed to send pairing response");
    }

    printf("Session %s resumed by %s\n", session_id.c_str(), request.client_name.c_str());
    fflush(stdout);
    start_streaming(session_id);
    return true;
}

void DesktopHost::accept_session(const PairingRequest& request) {
    // One viewer at a time: a new pairing supersedes any held session
    if (!m_session_id.empty()) {
        auto previous = m_sessions->find_session(m_session_id);
        if (previous && !previous->is_terminal()) {
            m_sessions->end_session(m_session_id);
        }
    }

    RemoteSession session = m_sessions->create_session(m_config.host_id, m_config.host_name,
                                                       request.client_id, request.client_name);
    m_sessions->on_connected(session.session_id);

    PairingResponse response;
    response.success = true;
    response.session_token = session.session_id;
    response.message = "Paired with " + m_config.host_name;
    if (!m_channel->send(response)) {
        LOG_WARN("Failed to send pairing response");
    }

    printf("Paired with %s - streaming started\n", request.client_name.c_str());
    fflush(stdout);
    start_streaming(session.session_id);
}

void DesktopHost::reject_pairing(PairingFailureReason reason, const std::string& message) {
    PairingResponse response;
    response.success = false;
    response.failure_reason = reason;
    response.message = message;
    if (!m_channel->send(response)) {
        LOG_WARN("Failed to send pairing rejection");
    }
}

void DesktopHost::handle_frame_ack(const FrameAck& ack) {
    if (!m_streaming) {
        return;
    }

    Milliseconds latency = std::chrono::duration_cast<Milliseconds>(m_clock.now() - ack.sent_at);
    if (latency.count() < 0) {
        latency = Milliseconds(0);
    }
    m_quality->record_frame_ack(latency);
    m_monitor->record_latency(latency);

    if (ack.request_full_frame) {
        LOG_INFO("Full frame requested by viewer");
        m_encoder->reset();
    }
}

void DesktopHost::handle_session_event(SessionEvent event, const RemoteSession& session) {
    LOG_DEBUG("Session %s: %s", session.session_id.c_str(), session_event_name(event));

    if (event != SessionEvent::ENDED && event != SessionEvent::RECONNECT_FAILED) {
        return;
    }

    if (session.session_id == m_session_id) {
        stop_streaming();
        cancel_reconnect_window();
        m_session_id.clear();
    }

    // A finished session invalidates the PIN that admitted it
    if (!m_shut_down) {
        m_pairing->refresh_pin();
    }
}

void DesktopHost::start_streaming(const std::string& session_id) {
    cancel_reconnect_window();

    m_session_id = session_id;
    m_streaming = true;

    // Fresh reference and fresh measurements for the new link
    m_encoder->reset();
    m_quality->reset();
    m_monitor->reset();
    m_capture->set_quality(m_quality->current_quality());

    const uint64_t interval_ms = 1000 / static_cast<uint64_t>(m_quality->current_frame_rate());
    if (m_capture_timer) {
        m_loop.set_timer_repeat(m_capture_timer, interval_ms);
    } else {
        m_capture_timer = m_loop.add_timer(0, interval_ms, [this]() { capture_and_send(); });
    }
    LOG_INFO("Streaming session %s at %d fps", session_id.c_str(), m_quality->current_frame_rate());
}

void DesktopHost::stop_streaming() {
    m_streaming = false;
    if (m_capture_timer) {
        m_loop.remove_timer(m_capture_timer);
        m_capture_timer = nullptr;
    }
}

void DesktopHost::capture_and_send() {
    if (!m_streaming || !m_channel->is_connected()) {
        return;
    }

    ScreenFrame frame;
    if (!m_capture->capture_frame(frame)) {
        m_capture_fail_count++;
        return;
    }
    frame.quality = m_quality->current_quality();

    EncodeResult encoded = m_encoder->encode(std::move(frame));
    const size_t bytes = encoded.frame.data.size();

    if (!m_channel->send(encoded.frame)) {
        // The viewer may now lack our reference; restart from a full frame
        m_send_fail_count++;
        m_encoder->reset();
        return;
    }

    m_quality->record_frame_sent(bytes);
    m_monitor->record_frame_sent(bytes);

    const uint32_t count = m_frame_count++;
    if (count % 60 == 0) {
        LOG_DEBUG("Frame %u: %zu bytes, delta=%d, regions=%zu",
                  count, bytes, encoded.is_delta, encoded.frame.regions.size());
    }
}

void DesktopHost::report_quality() {
    if (!m_streaming) {
        return;
    }

    const ConnectionQuality quality = m_monitor->snapshot();
    if (!m_channel->send(quality)) {
        LOG_DEBUG("Quality report not sent");
    }

    if (m_quality->update_settings()) {
        const int fps = m_quality->current_frame_rate();
        m_loop.set_timer_repeat(m_capture_timer, 1000 / static_cast<uint64_t>(fps));
        m_capture->set_quality(m_quality->current_quality());
    }

    const DeltaEncoderStats stats = m_encoder->stats();
    LOG_INFO("Stats: %.1f fps, %lld B/s, %lld ms (%s) | quality=%d fps=%d | delta %lld/%lld ratio=%.2f | fails: capture=%d send=%d",
             quality.fps, static_cast<long long>(quality.bandwidth),
             static_cast<long long>(quality.latency_ms), quality_rating_name(quality.rating),
             m_quality->current_quality(), m_quality->current_frame_rate(),
             static_cast<long long>(stats.delta_frames), static_cast<long long>(stats.total_frames),
             stats.average_compression_ratio, m_capture_fail_count, m_send_fail_count);
    m_capture_fail_count = 0;
    m_send_fail_count = 0;
}

void DesktopHost::arm_reconnect_window(const std::string& session_id) {
    cancel_reconnect_window();

    m_window_timer = m_loop.add_timer(static_cast<uint64_t>(std::max(m_config.reconnect_window_ms, 0)), 0,
                                      [this, session_id]() {
        cancel_reconnect_window();

        auto session = m_sessions->find_session(session_id);
        if (session && (session->status == SessionStatus::DISCONNECTED ||
                        session->status == SessionStatus::PENDING)) {
            LOG_INFO("Reconnect window for session %s expired", session_id.c_str());
            m_sessions->end_session(session_id);
        }
    });
}

void DesktopHost::cancel_reconnect_window() {
    if (m_window_timer) {
        m_loop.remove_timer(m_window_timer);
        m_window_timer = nullptr;
    }
}

void DesktopHost::shutdown() {
    if (m_shut_down) return;
    m_shut_down = true;

    if (m_initialized) {
        stop_streaming();
        cancel_reconnect_window();
        if (m_report_timer) {
            m_loop.remove_timer(m_report_timer);
            m_report_timer = nullptr;
        }

        if (!m_session_id.empty()) {
            auto session = m_sessions->find_session(m_session_id);
            if (session && !session->is_terminal()) {
                m_sessions->end_session(m_session_id);
            }
        }
        m_input->reset_all();
    }

    if (m_channel) {
        // No more callbacks into this object once it is shutting down
        m_channel->clear_handlers();
        m_channel->stop();
    }
    if (m_capture) {
        m_capture->shutdown();
    }
}

}  // namespace deskstream

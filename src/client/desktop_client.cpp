#include "desktop_client.hpp"
#include "../pairing/pairing_gate.hpp"
#include "../util/hostname.hpp"
#include "../util/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace deskstream {

DesktopClient::DesktopClient(const Clock& clock) : m_clock(clock) {}

DesktopClient::~DesktopClient() {
    shutdown();
}

bool DesktopClient::init(const ClientConfig& config) {
    m_config = config;
    if (m_config.client_id.empty()) {
        m_config.client_id = local_hostname();
    }
    if (m_config.client_name.empty()) {
        m_config.client_name = m_config.client_id;
    }

    if (!m_loop.init()) {
        LOG_ERROR("Failed to initialize event loop");
        return false;
    }

    try {
        m_sessions = std::make_unique<SessionManager>(m_clock, config.max_reconnect_attempts);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid viewer configuration: %s", e.what());
        return false;
    }

    if (!m_sink && !config.snapshot_file.empty()) {
        m_sink = std::make_unique<PpmSnapshotSink>(config.snapshot_file);
        LOG_INFO("Writing snapshots to %s", config.snapshot_file.c_str());
    }

    m_channel = std::make_unique<TransportChannel>(config.transport);
    register_handlers();

    m_initialized = true;
    return true;
}

void DesktopClient::register_handlers() {
    m_sessions->on_event([this](SessionEvent event, const RemoteSession& session) {
        handle_session_event(event, session);
    });

    m_channel->on_connection_state([this](bool connected) {
        if (!connected) {
            // Wake a pairing wait on this link
            std::lock_guard<std::mutex> lock(m_pair_mutex);
            m_pair_cv.notify_all();
        }
        m_loop.post([this, connected]() { handle_channel_state(connected); });
    });

    m_channel->subscribe<PairingResponse>([this](const PairingResponse& response) {
        handle_pairing_response(response);
    });

    m_channel->subscribe<ScreenFrame>([this](const ScreenFrame& frame) {
        handle_screen_frame(frame);
    });

    m_channel->subscribe<ConnectionQuality>([this](const ConnectionQuality& quality) {
        LOG_INFO("Host reports %.1f fps, %lld B/s, %lld ms (%s)", quality.fps,
                 static_cast<long long>(quality.bandwidth), static_cast<long long>(quality.latency_ms),
                 quality_rating_name(quality.rating));
        std::lock_guard<std::mutex> lock(m_quality_mutex);
        m_last_quality = quality;
    });

    m_channel->subscribe<ClipboardData>([](const ClipboardData& data) {
        LOG_INFO("Host clipboard update (%zu bytes)",
                 data.content_type == ClipboardContentType::IMAGE ? data.image_data.size() : data.text.size());
    });

    m_channel->subscribe<ChatMessage>([](const ChatMessage& message) {
        LOG_INFO("Chat from %s: %s", message.sender_name.c_str(), message.text.c_str());
    });

    m_channel->subscribe<FileTransferResponse>([](const FileTransferResponse& response) {
        LOG_INFO("File transfer %s %s: %s", response.transfer_id.c_str(),
                 response.accepted ? "accepted" : "declined", response.message.c_str());
    });
}

bool DesktopClient::connect(const DeviceInfo& host, const std::string& pin) {
    if (host.ip_address.empty() || host.port == 0) {
        LOG_ERROR("Device %s has no usable address", host.device_name.c_str());
        return false;
    }
    m_host_id = host.device_id;
    m_host_name = host.device_name;
    return connect(host.ip_address, host.port, pin);
}

bool DesktopClient::connect(const std::string& address, uint16_t port, const std::string& pin) {
    if (!m_initialized) {
        LOG_ERROR("Viewer not initialized");
        return false;
    }

    m_address = address;
    m_port = port;
    if (m_host_id.empty()) {
        m_host_id = address + ":" + std::to_string(port);
    }
    if (m_host_name.empty()) {
        m_host_name = address;
    }

    if (!m_channel->connect(address, port)) {
        LOG_ERROR("Failed to connect to %s:%u", address.c_str(), port);
        return false;
    }
    reset_decoder();

    if (!pair(pin, "")) {
        m_channel->disconnect();
        return false;
    }

    RemoteSession session = m_sessions->create_session(m_host_id, m_host_name,
                                                       m_config.client_id, m_config.client_name);
    m_session_id = session.session_id;
    m_sessions->on_connected(m_session_id);
    m_paired = true;

    printf("Paired with %s (%s:%u)\n", m_host_name.c_str(), address.c_str(), port);
    fflush(stdout);
    return true;
}

bool DesktopClient::pair(const std::string& pin, const std::string& token) {
    {
        std::lock_guard<std::mutex> lock(m_pair_mutex);
        m_pending_response.reset();
    }

    PairingRequest request;
    request.client_id = m_config.client_id;
    request.client_name = m_config.client_name;
    request.pin = pin;
    request.session_token = token;
    request.requested_at = m_clock.now();
    if (!m_channel->send(request)) {
        LOG_ERROR("Failed to send pairing request");
        return false;
    }

    std::unique_lock<std::mutex> lock(m_pair_mutex);
    m_pair_cv.wait_for(lock, std::chrono::milliseconds(m_config.pairing_timeout_ms), [this]() {
        return m_pending_response.has_value() || !m_channel->is_connected() || m_stopping.load();
    });

    if (!m_pending_response) {
        LOG_ERROR("No pairing response within %d ms", m_config.pairing_timeout_ms);
        return false;
    }

    const PairingResponse response = *m_pending_response;
    m_pending_response.reset();
    m_last_response = response;

    if (!response.success) {
        LOG_ERROR("Pairing rejected: %s (%s)", pairing_failure_name(response.failure_reason),
                  response.message.c_str());
        return false;
    }

    m_token = response.session_token;
    LOG_INFO("Pairing accepted: %s", response.message.c_str());
    return true;
}

void DesktopClient::handle_pairing_response(const PairingResponse& response) {
    std::lock_guard<std::mutex> lock(m_pair_mutex);
    m_pending_response = response;
    m_pair_cv.notify_all();
}

void DesktopClient::reset_decoder() {
    std::lock_guard<std::mutex> lock(m_decoder_mutex);
    m_decoder.reset();
    m_need_full_frame = false;
}

void DesktopClient::handle_screen_frame(const ScreenFrame& frame) {
    bool applied;
    bool request_full;
    {
        std::lock_guard<std::mutex> lock(m_decoder_mutex);
        applied = m_decoder.apply(frame);
        if (!applied) {
            m_need_full_frame = true;
        } else if (!frame.is_delta) {
            m_need_full_frame = false;
        }
        request_full = m_need_full_frame;

        if (applied && m_sink) {
            m_sink->on_frame(m_decoder.current());
        }
    }

    if (applied) {
        m_frames_received++;
    } else {
        m_frames_rejected++;
        LOG_DEBUG("Frame %s rejected, requesting full frame", frame.frame_id.c_str());
    }

    FrameAck ack;
    ack.frame_id = frame.frame_id;
    ack.sent_at = frame.timestamp;
    ack.request_full_frame = request_full;
    if (!m_channel->send(ack)) {
        LOG_DEBUG("Ack for %s not sent", frame.frame_id.c_str());
    }
}

void DesktopClient::handle_channel_state(bool connected) {
    if (connected || !m_paired || m_stopping) {
        return;
    }

    m_paired = false;
    m_sessions->on_disconnected(m_session_id, "channel lost");

    printf("Connection to %s lost - reconnecting\n", m_host_name.c_str());
    fflush(stdout);
    schedule_reconnect();
}

void DesktopClient::schedule_reconnect() {
    if (m_stopping || !m_sessions->try_reconnect(m_session_id)) {
        return;
    }

    // Exponential backoff: base, 2x base, 4x base ... capped
    const int attempt = m_sessions->get_session(m_session_id).reconnect_attempts;
    int64_t delay_ms = m_config.reconnect_delay_ms;
    for (int i = 1; i < attempt && delay_ms < m_config.max_reconnect_delay_ms; i++) {
        delay_ms *= 2;
    }
    delay_ms = std::max<int64_t>(std::min<int64_t>(delay_ms, m_config.max_reconnect_delay_ms), 0);

    LOG_INFO("Reconnect attempt %d in %lld ms", attempt, static_cast<long long>(delay_ms));
    m_reconnect_timer = m_loop.add_timer(static_cast<uint64_t>(delay_ms), 0, [this]() {
        m_loop.remove_timer(m_reconnect_timer);
        m_reconnect_timer = nullptr;
        attempt_reconnect();
    });
}

void DesktopClient::attempt_reconnect() {
    if (m_stopping) {
        return;
    }

    LOG_INFO("Reconnecting to %s:%u", m_address.c_str(), m_port);
    if (m_channel->connect(m_address, m_port)) {
        reset_decoder();
        // Token only: a stale PIN would count against the host's lockout
        if (pair("", m_token)) {
            m_sessions->on_connected(m_session_id);
            m_paired = true;
            printf("Reconnected to %s\n", m_host_name.c_str());
            fflush(stdout);
            return;
        }
        m_channel->disconnect();
    }

    // Session is Pending again; spend another attempt or fail
    schedule_reconnect();
}

void DesktopClient::handle_session_event(SessionEvent event, const RemoteSession& session) {
    LOG_DEBUG("Session %s: %s", session.session_id.c_str(), session_event_name(event));

    if (event == SessionEvent::RECONNECT_FAILED) {
        printf("Giving up on %s after %d reconnect attempts\n", session.host_name.c_str(),
               session.max_reconnect_attempts);
        fflush(stdout);
        m_loop.stop();
    }
}

bool DesktopClient::send_input(const InputEvent& event) {
    if (!m_paired) {
        return false;
    }
    return m_channel->send(event);
}

bool DesktopClient::send_clipboard(const ClipboardData& data) {
    if (!m_paired) {
        return false;
    }
    return m_channel->send(data);
}

std::string DesktopClient::session_token() const {
    std::lock_guard<std::mutex> lock(m_pair_mutex);
    return m_token;
}

std::optional<PairingResponse> DesktopClient::last_pairing_response() const {
    std::lock_guard<std::mutex> lock(m_pair_mutex);
    return m_last_response;
}

std::optional<ConnectionQuality> DesktopClient::last_quality() const {
    std::lock_guard<std::mutex> lock(m_quality_mutex);
    return m_last_quality;
}

void DesktopClient::run() {
    if (!m_initialized) {
        LOG_ERROR("Viewer not initialized");
        return;
    }

    m_loop.run();

    shutdown();
    LOG_INFO("Viewer stopped");
}

void DesktopClient::stop() {
    m_stopping = true;
    m_loop.stop();
}

void DesktopClient::shutdown() {
    if (m_shut_down) return;
    m_shut_down = true;
    m_stopping = true;

    if (m_reconnect_timer) {
        m_loop.remove_timer(m_reconnect_timer);
        m_reconnect_timer = nullptr;
    }

    if (m_sessions && !m_session_id.empty()) {
        auto session = m_sessions->find_session(m_session_id);
        if (session && !session->is_terminal()) {
            m_sessions->end_session(m_session_id);
        }
    }
    m_paired = false;

    if (m_channel) {
        // No more callbacks into this object once it is shutting down
        m_channel->clear_handlers();
        m_channel->stop();
    }
}

}  // namespace deskstream

#include "session_manager.hpp"
#include "../util/logger.hpp"
#include "../util/random.hpp"
#include <stdexcept>

namespace deskstream {

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::PENDING:      return "pending";
        case SessionStatus::CONNECTED:    return "connected";
        case SessionStatus::DISCONNECTED: return "disconnected";
        case SessionStatus::ERROR:        return "error";
        case SessionStatus::ENDED:        return "ended";
    }
    return "unknown";
}

const char* session_event_name(SessionEvent event) {
    switch (event) {
        case SessionEvent::CREATED:          return "created";
        case SessionEvent::CONNECTED:        return "connected";
        case SessionEvent::DISCONNECTED:     return "disconnected";
        case SessionEvent::ENDED:            return "ended";
        case SessionEvent::RECONNECT_FAILED: return "reconnect-failed";
    }
    return "unknown";
}

SessionManager::SessionManager(const Clock& clock, int max_reconnect_attempts)
    : m_clock(clock), m_max_reconnect_attempts(max_reconnect_attempts) {
    if (max_reconnect_attempts < 0) {
        throw std::invalid_argument("SessionManager: max_reconnect_attempts must not be negative");
    }
}

RemoteSession SessionManager::create_session(const std::string& host_id, const std::string& host_name,
                                             const std::string& client_id, const std::string& client_name) {
    RemoteSession session;
    session.session_id = generate_id();
    session.host_id = host_id;
    session.host_name = host_name;
    session.client_id = client_id;
    session.client_name = client_name;
    session.status = SessionStatus::PENDING;
    session.created_at = m_clock.now();
    session.max_reconnect_attempts = m_max_reconnect_attempts;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sessions[session.session_id] = session;
    }

    LOG_INFO("Session %s created (%s -> %s)", session.session_id.c_str(),
             client_name.c_str(), host_name.c_str());
    emit(SessionEvent::CREATED, session);
    return session;
}

bool SessionManager::on_connected(const std::string& session_id) {
    RemoteSession snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        RemoteSession& session = require(session_id);

        if (session.status != SessionStatus::PENDING && session.status != SessionStatus::DISCONNECTED) {
            LOG_WARN("Session %s cannot connect from state %s", session_id.c_str(),
                     session_status_name(session.status));
            return false;
        }

        session.status = SessionStatus::CONNECTED;
        session.last_connected_at = m_clock.now();
        session.reconnect_attempts = 0;
        session.disconnect_reason.reset();
        snapshot = session;
    }

    LOG_INFO("Session %s connected", session_id.c_str());
    emit(SessionEvent::CONNECTED, snapshot);
    return true;
}

bool SessionManager::on_disconnected(const std::string& session_id, const std::string& reason) {
    RemoteSession snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        RemoteSession& session = require(session_id);

        if (session.status != SessionStatus::CONNECTED && session.status != SessionStatus::PENDING) {
            LOG_WARN("Session %s cannot disconnect from state %s", session_id.c_str(),
                     session_status_name(session.status));
            return false;
        }

        const Timestamp now = m_clock.now();
        if (session.status == SessionStatus::CONNECTED) {
            close_interval(session, now);
        }
        session.status = SessionStatus::DISCONNECTED;
        session.disconnected_at = now;
        session.disconnect_reason = reason;
        snapshot = session;
    }

    LOG_INFO("Session %s disconnected: %s", session_id.c_str(), reason.empty() ? "(no reason)" : reason.c_str());
    emit(SessionEvent::DISCONNECTED, snapshot);
    return true;
}

bool SessionManager::try_reconnect(const std::string& session_id) {
    RemoteSession snapshot;
    bool accepted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        RemoteSession& session = require(session_id);

        if (session.status != SessionStatus::DISCONNECTED && session.status != SessionStatus::PENDING) {
            LOG_WARN("Session %s cannot reconnect from state %s", session_id.c_str(),
                     session_status_name(session.status));
            return false;
        }

        session.reconnect_attempts++;
        accepted = session.reconnect_attempts <= session.max_reconnect_attempts;
        session.status = accepted ? SessionStatus::PENDING : SessionStatus::ERROR;
        snapshot = session;
        if (!accepted) {
            retire_locked(session_id);
        }
    }

    if (!accepted) {
        LOG_WARN("Session %s exhausted %d reconnect attempts", session_id.c_str(),
                 snapshot.max_reconnect_attempts);
        emit(SessionEvent::RECONNECT_FAILED, snapshot);
        return false;
    }

    LOG_INFO("Session %s reconnect attempt %d/%d", session_id.c_str(),
             snapshot.reconnect_attempts, snapshot.max_reconnect_attempts);
    return true;
}

bool SessionManager::end_session(const std::string& session_id) {
    RemoteSession snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        RemoteSession& session = require(session_id);

        if (session.is_terminal()) {
            LOG_WARN("Session %s already %s", session_id.c_str(), session_status_name(session.status));
            return false;
        }

        if (session.status == SessionStatus::CONNECTED) {
            const Timestamp now = m_clock.now();
            close_interval(session, now);
            session.disconnected_at = now;
        }
        session.status = SessionStatus::ENDED;
        snapshot = session;
        retire_locked(session_id);
    }

    LOG_INFO("Session %s ended", session_id.c_str());
    emit(SessionEvent::ENDED, snapshot);
    return true;
}

void SessionManager::retire_locked(const std::string& session_id) {
    m_terminal_ids.push_back(session_id);
    while (m_terminal_ids.size() > MAX_TERMINAL_SESSIONS) {
        LOG_DEBUG("Forgetting terminal session %s", m_terminal_ids.front().c_str());
        m_sessions.erase(m_terminal_ids.front());
        m_terminal_ids.pop_front();
    }
}

RemoteSession SessionManager::get_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return require(session_id);
}

std::optional<RemoteSession> SessionManager::find_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RemoteSession> SessionManager::get_all_sessions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<RemoteSession> out;
    out.reserve(m_sessions.size());
    for (const auto& entry : m_sessions) {
        out.push_back(entry.second);
    }
    return out;
}

std::optional<RemoteSession> SessionManager::get_active_session() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : m_sessions) {
        if (entry.second.status == SessionStatus::CONNECTED) {
            return entry.second;
        }
    }
    return std::nullopt;
}

Milliseconds SessionManager::connected_duration(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const RemoteSession& session = require(session_id);

    Milliseconds total = session.accumulated_duration;
    if (session.status == SessionStatus::CONNECTED && session.last_connected_at) {
        total += std::chrono::duration_cast<Milliseconds>(m_clock.now() - *session.last_connected_at);
    }
    return total;
}

void SessionManager::on_event(EventHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.push_back(std::move(handler));
}

RemoteSession& SessionManager::require(const std::string& session_id) {
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) {
        throw std::out_of_range("Unknown session: " + session_id);
    }
    return it->second;
}

const RemoteSession& SessionManager::require(const std::string& session_id) const {
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) {
        throw std::out_of_range("Unknown session: " + session_id);
    }
    return it->second;
}

void SessionManager::close_interval(RemoteSession& session, Timestamp now) {
    if (session.last_connected_at) {
        session.accumulated_duration +=
            std::chrono::duration_cast<Milliseconds>(now - *session.last_connected_at);
    }
}

void SessionManager::emit(SessionEvent event, const RemoteSession& session) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handlers = m_handlers;
    }
    for (auto& handler : handlers) {
        handler(event, session);
    }
}

}  // namespace deskstream

#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../util/clock.hpp"

namespace deskstream {

enum class SessionStatus {
    PENDING,
    CONNECTED,
    DISCONNECTED,
    ERROR,
    ENDED
};

const char* session_status_name(SessionStatus status);

struct RemoteSession {
    std::string session_id;
    std::string host_id;
    std::string host_name;
    std::string client_id;
    std::string client_name;

    SessionStatus status = SessionStatus::PENDING;
    Timestamp created_at;
    std::optional<Timestamp> last_connected_at;
    std::optional<Timestamp> disconnected_at;
    std::optional<std::string> disconnect_reason;

    int reconnect_attempts = 0;
    int max_reconnect_attempts = 3;

    Milliseconds accumulated_duration{0};

    bool is_terminal() const {
        return status == SessionStatus::ERROR || status == SessionStatus::ENDED;
    }
};

enum class SessionEvent {
    CREATED,
    CONNECTED,
    DISCONNECTED,
    ENDED,
    RECONNECT_FAILED
};

const char* session_event_name(SessionEvent event);

// Owns every RemoteSession and drives the state machine:
//
//   Pending      --on_connected-->     Connected
//   Connected    --on_disconnected-->  Disconnected
//   Disconnected --try_reconnect-->    Pending  (or Error once attempts run out)
//   any live     --end_session-->      Ended
//
// Error and Ended are terminal. Only the most recent MAX_TERMINAL_SESSIONS
// terminal sessions are kept; older ones are forgotten. Handlers receive a
// snapshot of the session and are invoked after the manager's lock is released.
class SessionManager {
public:
    using EventHandler = std::function<void(SessionEvent, const RemoteSession&)>;

    static constexpr int DEFAULT_MAX_RECONNECT_ATTEMPTS = 3;
    static constexpr size_t MAX_TERMINAL_SESSIONS = 32;

    explicit SessionManager(const Clock& clock = SystemClock::instance(),
                            int max_reconnect_attempts = DEFAULT_MAX_RECONNECT_ATTEMPTS);

    RemoteSession create_session(const std::string& host_id, const std::string& host_name,
                                 const std::string& client_id, const std::string& client_name);

    // Transitions return false (and log) when the current state does not
    // allow them. Unknown ids throw std::out_of_range.
    bool on_connected(const std::string& session_id);
    bool on_disconnected(const std::string& session_id, const std::string& reason = "");
    bool try_reconnect(const std::string& session_id);
    bool end_session(const std::string& session_id);

    RemoteSession get_session(const std::string& session_id) const;
    std::optional<RemoteSession> find_session(const std::string& session_id) const;
    std::vector<RemoteSession> get_all_sessions() const;
    std::optional<RemoteSession> get_active_session() const;

    // Completed intervals plus the running one if Connected
    Milliseconds connected_duration(const std::string& session_id) const;

    void on_event(EventHandler handler);

private:
    RemoteSession& require(const std::string& session_id);
    const RemoteSession& require(const std::string& session_id) const;
    void close_interval(RemoteSession& session, Timestamp now);
    void retire_locked(const std::string& session_id);
    void emit(SessionEvent event, const RemoteSession& session);

    const Clock& m_clock;
    const int m_max_reconnect_attempts;

    mutable std::mutex m_mutex;
    std::map<std::string, RemoteSession> m_sessions;
    std::deque<std::string> m_terminal_ids;   // Oldest first
    std::vector<EventHandler> m_handlers;
};

}  // namespace deskstream

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "deskstream/config.hpp"
#include "../protocol/messages.hpp"
#include "../security/tls_context.hpp"

namespace deskstream {

// One framed, optionally TLS-encrypted stream to a single peer.
//
// Host side calls start(port) and serves one inbound connection at a time; a
// newer connection replaces the current one. Viewer side calls connect().
// Each live connection owns a reader thread and a writer thread fed by a
// bounded queue. Handlers run on the reader thread (messages) or on whichever
// thread observed a transition (connection state). State handlers never run
// concurrently and see transitions in the order the link changed.
class TransportChannel {
public:
    using StateHandler = std::function<void(bool connected)>;

    explicit TransportChannel(const TransportConfig& config = TransportConfig{});
    ~TransportChannel();

    TransportChannel(const TransportChannel&) = delete;
    TransportChannel& operator=(const TransportChannel&) = delete;

    // Bind and accept in the background. Port 0 picks an ephemeral port.
    bool start(uint16_t port);

    // Dial out, bounded by connect and handshake timeouts
    bool connect(const std::string& address, uint16_t port);

    // Flush queued frames within disconnect_timeout, then close. Idempotent.
    void disconnect();

    // disconnect() plus listener shutdown
    void stop();

    // Queue a message for the writer thread. Blocks at most write_timeout
    // when the queue is full. Throws std::logic_error if neither start()
    // nor connect() was ever called.
    bool send(const TransportMessage& message);

    bool is_connected() const { return m_connected.load(); }
    bool is_listening() const { return m_running.load(); }

    uint16_t local_port() const { return m_local_port; }
    std::string peer_address() const;

    // Server certificate fingerprint when TLS is active on the host side
    const std::string& tls_fingerprint() const { return m_tls.fingerprint(); }

    template <typename T>
    void subscribe(std::function<void(const T&)> handler) {
        const size_t index = static_cast<size_t>(message_type_of<T>()) - 1;
        std::lock_guard<std::mutex> lock(m_handler_mutex);
        m_handlers[index].push_back([h = std::move(handler)](const TransportMessage& msg) {
            h(std::get<T>(msg));
        });
    }

    void on_connection_state(StateHandler handler);

    void clear_handlers();

private:
    struct Link;
    using LinkPtr = std::shared_ptr<Link>;

    void accept_loop();
    bool handshake(int fd, SSL* ssl, bool server);

    LinkPtr make_link(int fd, SSL* ssl, const std::string& peer);
    void install(const LinkPtr& link);
    void start_threads(const LinkPtr& link);
    void close_link(const LinkPtr& link, bool graceful);
    void fail_link(const LinkPtr& link, const char* reason);
    void detach(const LinkPtr& link);
    bool join_link(const LinkPtr& link);
    void reap();

    void reader_loop(LinkPtr link);
    void writer_loop(LinkPtr link);
    bool read_exact(Link& link, uint8_t* buf, size_t len);
    bool write_all(Link& link, const uint8_t* buf, size_t len);

    // State changes are queued under m_link_mutex together with the m_link
    // change that causes them, then handed to the state handlers in order.
    void queue_state_locked(bool connected);
    void deliver_state_events();
    void dispatch(const TransportMessage& message);

    enum class TlsRole { NONE, SERVER, CLIENT };

    TransportConfig m_config;
    TLSContext m_tls;
    TlsRole m_tls_role = TlsRole::NONE;

    int m_listen_fd = -1;
    uint16_t m_local_port = 0;
    std::thread m_accept_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_used{false};
    std::atomic<bool> m_connected{false};

    mutable std::mutex m_link_mutex;
    LinkPtr m_link;
    std::vector<LinkPtr> m_retired;
    std::deque<bool> m_state_events;
    bool m_delivering_state = false;

    std::mutex m_handler_mutex;
    std::array<std::vector<std::function<void(const TransportMessage&)>>, MESSAGE_TYPE_COUNT> m_handlers;
    std::vector<StateHandler> m_state_handlers;
};

}  // namespace deskstream

#include "transport_channel.hpp"
#include "../protocol/message_codec.hpp"
#include "../security/ssl_error.hpp"
#include "../util/hostname.hpp"
#include "../util/logger.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <deque>
#include <stdexcept>

namespace deskstream {

namespace {

// Upper bound on any single poll() so stop flags are observed promptly
constexpr int POLL_SLICE_MS = 100;

using SteadyClock = std::chrono::steady_clock;

int wait_fd(int fd, short events, int timeout_ms) {
    struct pollfd pfd = {};
    pfd.fd = fd;
    pfd.events = events;
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0 && errno == EINTR) {
        return 0;
    }
    return rc;
}

int elapsed_ms(SteadyClock::time_point since) {
    return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - since).count());
}

void set_nodelay(int fd) {
    int opt = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        LOG_DEBUG("TCP_NODELAY not applied: %s", strerror(errno));
    }
}

void ignore_sigpipe() {
    // SSL_write on a reset socket raises SIGPIPE; surface it as EPIPE instead
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

struct TransportChannel::Link {
    int fd = -1;
    SSL* ssl = nullptr;
    std::string peer;

    std::mutex io_mutex;  // Held for each SSL_read/SSL_write call, never across a wait

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::vector<uint8_t>> queue;
    bool writing = false;
    bool draining = false;

    std::atomic<bool> stop{false};
    std::atomic<bool> down{false};

    std::mutex thread_mutex;
    std::thread reader;
    std::thread writer;

    ~Link() {
        if (ssl) SSL_free(ssl);
        if (fd >= 0) ::close(fd);
    }
};

TransportChannel::TransportChannel(const TransportConfig& config)
    : m_config(config) {
    m_config.max_queued_frames = std::max<size_t>(1, m_config.max_queued_frames);
    ignore_sigpipe();
}

TransportChannel::~TransportChannel() {
    stop();
}

bool TransportChannel::start(uint16_t port) {
    m_used = true;

    if (m_running) {
        LOG_WARN("Transport already listening on port %u", m_local_port);
        return false;
    }
    if (m_accept_thread.joinable()) {
        m_accept_thread.join();
    }

    if (m_config.tls.enabled && m_tls_role != TlsRole::SERVER) {
        if (!m_tls.init_server(m_config.tls, local_hostname())) {
            LOG_ERROR("TLS init failed, not listening");
            return false;
        }
        m_tls_role = TlsRole::SERVER;
    }

    m_listen_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (m_listen_fd < 0) {
        LOG_ERROR("Failed to create TCP socket: %s", strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(m_listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);

    if (bind(m_listen_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("Failed to bind transport socket to port %u: %s", port, strerror(errno));
        ::close(m_listen_fd);
        m_listen_fd = -1;
        return false;
    }

    if (listen(m_listen_fd, 4) < 0) {
        LOG_ERROR("Failed to listen on transport socket: %s", strerror(errno));
        ::close(m_listen_fd);
        m_listen_fd = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(m_listen_fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        m_local_port = ntohs(addr.sin_port);
    } else {
        m_local_port = port;
    }

    m_running = true;
    m_accept_thread = std::thread(&TransportChannel::accept_loop, this);

    LOG_INFO("Transport listening on port %u (%s)", m_local_port,
             m_config.tls.enabled ? "TLS" : "no TLS");
    return true;
}

bool TransportChannel::connect(const std::string& address, uint16_t port) {
    m_used = true;

    disconnect();

    if (m_config.tls.enabled && m_tls_role != TlsRole::CLIENT) {
        if (!m_tls.init_client(m_config.tls)) {
            return false;
        }
        m_tls_role = TlsRole::CLIENT;
    }

    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(address.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        LOG_ERROR("Failed to resolve %s: %s", address.c_str(), gai_strerror(rc));
        return false;
    }

    int fd = -1;
    int last_error = 0;
    for (struct addrinfo* ai = results; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }

        last_error = errno;
        if (last_error == EINPROGRESS) {
            int ready = wait_fd(fd, POLLOUT, m_config.connect_timeout_ms);
            if (ready > 0) {
                int err = 0;
                socklen_t err_len = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &err_len);
                if (err == 0) {
                    break;
                }
                last_error = err;
            } else {
                last_error = ready == 0 ? ETIMEDOUT : errno;
            }
        }

        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(results);

    if (fd < 0) {
        LOG_ERROR("Failed to connect to %s:%u: %s", address.c_str(), port, strerror(last_error));
        return false;
    }

    set_nodelay(fd);

    SSL* ssl = nullptr;
    if (m_config.tls.enabled) {
        ssl = SSL_new(m_tls.get());
        if (!ssl) {
            LOG_ERROR("SSL_new failed: %s", drain_ssl_errors().c_str());
            ::close(fd);
            return false;
        }
        SSL_set_fd(ssl, fd);

        if (!m_tls.configure_client(ssl) || !handshake(fd, ssl, false)) {
            SSL_free(ssl);
            ::close(fd);
            return false;
        }
        LOG_INFO("TLS handshake completed (%s, %s)", SSL_get_version(ssl), SSL_get_cipher(ssl));
    }

    install(make_link(fd, ssl, address));
    LOG_INFO("Connected to %s:%u", address.c_str(), port);
    return true;
}

void TransportChannel::disconnect() {
    LinkPtr link;
    {
        std::lock_guard<std::mutex> lock(m_link_mutex);
        link = std::move(m_link);
        if (link) {
            queue_state_locked(false);
        }
    }

    if (link) {
        LOG_INFO("Disconnecting from %s", link->peer.c_str());
        close_link(link, true);
    }
    deliver_state_events();

    reap();
}

void TransportChannel::stop() {
    m_running = false;
    if (m_accept_thread.joinable()) {
        m_accept_thread.join();
    }
    if (m_listen_fd >= 0) {
        ::close(m_listen_fd);
        m_listen_fd = -1;
        LOG_INFO("Transport listener closed");
    }

    disconnect();
}

bool TransportChannel::send(const TransportMessage& message) {
    if (!m_used) {
        throw std::logic_error("TransportChannel::send called before start() or connect()");
    }

    LinkPtr link;
    {
        std::lock_guard<std::mutex> lock(m_link_mutex);
        link = m_link;
    }
    if (!link) {
        return false;
    }

    const MessageType type = message_type_of(message);
    std::vector<uint8_t> frame = encode_frame(message);
    if (frame.size() - FRAME_HEADER_SIZE + 1 > MAX_FRAME_SIZE) {
        LOG_WARN("Refusing to send %s: %zu bytes exceeds the frame limit",
                 message_type_name(type), frame.size());
        return false;
    }

    std::unique_lock<std::mutex> lock(link->queue_mutex);
    bool ready = link->queue_cv.wait_for(lock, std::chrono::milliseconds(m_config.write_timeout_ms), [&] {
        return link->stop.load() || link->draining || link->queue.size() < m_config.max_queued_frames;
    });

    if (!ready) {
        LOG_WARN("Send queue to %s full for %d ms, dropping %s",
                 link->peer.c_str(), m_config.write_timeout_ms, message_type_name(type));
        return false;
    }
    if (link->stop || link->draining) {
        return false;
    }

    link->queue.push_back(std::move(frame));
    lock.unlock();
    link->queue_cv.notify_all();
    return true;
}

std::string TransportChannel::peer_address() const {
    std::lock_guard<std::mutex> lock(m_link_mutex);
    return m_link ? m_link->peer : std::string();
}

void TransportChannel::on_connection_state(StateHandler handler) {
    std::lock_guard<std::mutex> lock(m_handler_mutex);
    m_state_handlers.push_back(std::move(handler));
}

void TransportChannel::clear_handlers() {
    std::lock_guard<std::mutex> lock(m_handler_mutex);
    for (auto& list : m_handlers) {
        list.clear();
    }
    m_state_handlers.clear();
}

void TransportChannel::accept_loop() {
    while (m_running) {
        int ready = wait_fd(m_listen_fd, POLLIN, POLL_SLICE_MS);
        reap();
        if (ready <= 0) {
            continue;
        }

        struct sockaddr_in client_addr = {};
        socklen_t client_len = sizeof(client_addr);
        int fd = ::accept4(m_listen_fd, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len,
                           SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_WARN("Failed to accept client: %s", strerror(errno));
            }
            continue;
        }

        char host[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &client_addr.sin_addr, host, sizeof(host));
        LOG_INFO("Client connected from %s", host);

        set_nodelay(fd);

        SSL* ssl = nullptr;
        if (m_config.tls.enabled) {
            ssl = SSL_new(m_tls.get());
            if (!ssl) {
                LOG_ERROR("SSL_new failed: %s", drain_ssl_errors().c_str());
                ::close(fd);
                continue;
            }
            SSL_set_fd(ssl, fd);

            if (!handshake(fd, ssl, true)) {
                SSL_free(ssl);
                ::close(fd);
                continue;
            }
            LOG_INFO("TLS handshake completed (%s)", SSL_get_version(ssl));
        }

        install(make_link(fd, ssl, host));
    }
}

bool TransportChannel::handshake(int fd, SSL* ssl, bool server) {
    const auto started = SteadyClock::now();

    while (true) {
        int rc = server ? SSL_accept(ssl) : SSL_connect(ssl);
        if (rc == 1) {
            return true;
        }

        short events;
        int err = SSL_get_error(ssl, rc);
        if (err == SSL_ERROR_WANT_READ) {
            events = POLLIN;
        } else if (err == SSL_ERROR_WANT_WRITE) {
            events = POLLOUT;
        } else {
            LOG_ERROR("TLS handshake failed: %s", drain_ssl_errors().c_str());
            if (!server) {
                long verify = SSL_get_verify_result(ssl);
                if (verify != X509_V_OK) {
                    LOG_ERROR("Peer certificate rejected: %s", X509_verify_cert_error_string(verify));
                }
            }
            return false;
        }

        int remaining = m_config.handshake_timeout_ms - elapsed_ms(started);
        if (remaining <= 0) {
            LOG_WARN("TLS handshake timed out after %d ms", m_config.handshake_timeout_ms);
            return false;
        }
        if (server && !m_running) {
            return false;
        }

        if (wait_fd(fd, events, std::min(remaining, POLL_SLICE_MS)) < 0) {
            LOG_ERROR("poll failed during handshake: %s", strerror(errno));
            return false;
        }
    }
}

TransportChannel::LinkPtr TransportChannel::make_link(int fd, SSL* ssl, const std::string& peer) {
    auto link = std::make_shared<Link>();
    link->fd = fd;
    link->ssl = ssl;
    link->peer = peer;
    return link;
}

void TransportChannel::install(const LinkPtr& link) {
    LinkPtr old;
    {
        std::lock_guard<std::mutex> lock(m_link_mutex);
        old = std::move(m_link);
        m_link = link;
        if (old) {
            queue_state_locked(false);
        }
        queue_state_locked(true);
    }

    if (old) {
        LOG_INFO("Connection from %s replaced by %s", old->peer.c_str(), link->peer.c_str());
        close_link(old, false);
    }

    deliver_state_events();
    start_threads(link);
}

void TransportChannel::start_threads(const LinkPtr& link) {
    std::lock_guard<std::mutex> lock(link->thread_mutex);
    if (link->stop) {
        return;
    }
    link->reader = std::thread(&TransportChannel::reader_loop, this, link);
    link->writer = std::thread(&TransportChannel::writer_loop, this, link);
}

void TransportChannel::close_link(const LinkPtr& link, bool graceful) {
    if (link->down.exchange(true)) {
        return;
    }

    {
        std::unique_lock<std::mutex> lock(link->queue_mutex);
        if (graceful) {
            link->draining = true;
            bool drained = link->queue_cv.wait_for(
                lock, std::chrono::milliseconds(m_config.disconnect_timeout_ms), [&] {
                    return link->stop.load() || (link->queue.empty() && !link->writing);
                });
            if (!drained) {
                LOG_WARN("Disconnect from %s timed out with %zu frames unsent",
                         link->peer.c_str(), link->queue.size());
            }
        }
        link->stop = true;
        link->queue.clear();
    }
    link->queue_cv.notify_all();

    {
        std::lock_guard<std::mutex> lock(link->io_mutex);
        if (link->ssl) {
            // Best-effort close_notify; the socket is non-blocking
            SSL_shutdown(link->ssl);
            drain_ssl_errors();
        }
    }
    ::shutdown(link->fd, SHUT_RDWR);

    std::lock_guard<std::mutex> lock(m_link_mutex);
    m_retired.push_back(link);
}

void TransportChannel::fail_link(const LinkPtr& link, const char* reason) {
    detach(link);
    if (!link->down) {
        LOG_INFO("Connection to %s lost: %s", link->peer.c_str(), reason);
    }
    close_link(link, false);
    deliver_state_events();
}

void TransportChannel::detach(const LinkPtr& link) {
    std::lock_guard<std::mutex> lock(m_link_mutex);
    if (m_link != link) {
        // Already replaced or disconnected; the state belongs to the new owner
        return;
    }
    m_link.reset();
    queue_state_locked(false);
}

bool TransportChannel::join_link(const LinkPtr& link) {
    std::thread reader;
    std::thread writer;
    {
        std::lock_guard<std::mutex> lock(link->thread_mutex);
        const auto self = std::this_thread::get_id();
        if (link->reader.get_id() == self || link->writer.get_id() == self) {
            return false;
        }
        reader = std::move(link->reader);
        writer = std::move(link->writer);
    }

    if (reader.joinable()) reader.join();
    if (writer.joinable()) writer.join();

    std::lock_guard<std::mutex> lock(link->io_mutex);
    if (link->ssl) {
        SSL_free(link->ssl);
        link->ssl = nullptr;
    }
    if (link->fd >= 0) {
        ::close(link->fd);
        link->fd = -1;
    }
    return true;
}

void TransportChannel::reap() {
    std::vector<LinkPtr> retired;
    {
        std::lock_guard<std::mutex> lock(m_link_mutex);
        retired.swap(m_retired);
    }
    if (retired.empty()) {
        return;
    }

    std::vector<LinkPtr> pending;
    for (auto& link : retired) {
        if (!join_link(link)) {
            pending.push_back(link);
        }
    }

    if (!pending.empty()) {
        std::lock_guard<std::mutex> lock(m_link_mutex);
        m_retired.insert(m_retired.end(), pending.begin(), pending.end());
    }
}

void TransportChannel::reader_loop(LinkPtr link) {
    std::vector<uint8_t> payload;

    while (!link->stop) {
        uint8_t header[FRAME_HEADER_SIZE];
        if (!read_exact(*link, header, sizeof(header))) {
            break;
        }

        FrameHeader frame;
        if (!parse_frame_header(header, frame)) {
            LOG_WARN("Protocol error from %s: invalid frame header", link->peer.c_str());
            fail_link(link, "protocol error");
            return;
        }

        payload.resize(frame.payload_size());
        if (!payload.empty() && !read_exact(*link, payload.data(), payload.size())) {
            break;
        }

        auto message = decode_payload(frame.type, payload.data(), payload.size());
        if (!message) {
            LOG_WARN("Protocol error from %s: malformed %s payload (%zu bytes)",
                     link->peer.c_str(), message_type_name(frame.type), payload.size());
            fail_link(link, "protocol error");
            return;
        }

        dispatch(*message);
    }

    if (!link->stop) {
        fail_link(link, "connection closed");
    }
}

void TransportChannel::writer_loop(LinkPtr link) {
    while (true) {
        std::vector<uint8_t> frame;
        {
            std::unique_lock<std::mutex> lock(link->queue_mutex);
            link->queue_cv.wait(lock, [&] { return link->stop.load() || !link->queue.empty(); });
            if (link->stop) {
                return;
            }
            frame = std::move(link->queue.front());
            link->queue.pop_front();
            link->writing = true;
        }
        link->queue_cv.notify_all();

        bool ok = write_all(*link, frame.data(), frame.size());

        {
            std::lock_guard<std::mutex> lock(link->queue_mutex);
            link->writing = false;
        }
        link->queue_cv.notify_all();

        if (!ok) {
            if (!link->stop) {
                fail_link(link, "write failed");
            }
            return;
        }
    }
}

bool TransportChannel::read_exact(Link& link, uint8_t* buf, size_t len) {
    size_t done = 0;

    while (done < len) {
        if (link.stop) {
            return false;
        }

        short want = 0;
        size_t n = 0;
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            if (link.ssl) {
                int chunk = static_cast<int>(std::min<size_t>(len - done, INT_MAX));
                int rc = SSL_read(link.ssl, buf + done, chunk);
                if (rc > 0) {
                    n = static_cast<size_t>(rc);
                } else {
                    int err = SSL_get_error(link.ssl, rc);
                    if (err == SSL_ERROR_WANT_READ) {
                        want = POLLIN;
                    } else if (err == SSL_ERROR_WANT_WRITE) {
                        want = POLLOUT;
                    } else if (err == SSL_ERROR_ZERO_RETURN) {
                        LOG_DEBUG("Peer %s closed the TLS session", link.peer.c_str());
                        return false;
                    } else {
                        if (!link.stop) {
                            LOG_WARN("TLS read from %s failed: %s", link.peer.c_str(), drain_ssl_errors().c_str());
                        }
                        return false;
                    }
                }
            } else {
                ssize_t rc = ::recv(link.fd, buf + done, len - done, 0);
                if (rc > 0) {
                    n = static_cast<size_t>(rc);
                } else if (rc == 0) {
                    LOG_DEBUG("Peer %s closed the connection", link.peer.c_str());
                    return false;
                } else if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    want = POLLIN;
                } else {
                    if (!link.stop) {
                        LOG_WARN("recv from %s failed: %s", link.peer.c_str(), strerror(errno));
                    }
                    return false;
                }
            }
        }

        if (want) {
            wait_fd(link.fd, want, POLL_SLICE_MS);
            continue;
        }
        done += n;
    }

    return true;
}

bool TransportChannel::write_all(Link& link, const uint8_t* buf, size_t len) {
    size_t done = 0;
    auto last_progress = SteadyClock::now();

    while (done < len) {
        if (link.stop) {
            return false;
        }

        short want = 0;
        size_t n = 0;
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            if (link.ssl) {
                int chunk = static_cast<int>(std::min<size_t>(len - done, INT_MAX));
                int rc = SSL_write(link.ssl, buf + done, chunk);
                if (rc > 0) {
                    n = static_cast<size_t>(rc);
                } else {
                    int err = SSL_get_error(link.ssl, rc);
                    if (err == SSL_ERROR_WANT_WRITE) {
                        want = POLLOUT;
                    } else if (err == SSL_ERROR_WANT_READ) {
                        want = POLLIN;
                    } else {
                        if (!link.stop) {
                            LOG_WARN("TLS write to %s failed: %s", link.peer.c_str(), drain_ssl_errors().c_str());
                        }
                        return false;
                    }
                }
            } else {
                ssize_t rc = ::send(link.fd, buf + done, len - done, MSG_NOSIGNAL);
                if (rc >= 0) {
                    n = static_cast<size_t>(rc);
                } else if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    want = POLLOUT;
                } else {
                    if (!link.stop) {
                        LOG_WARN("send to %s failed: %s", link.peer.c_str(), strerror(errno));
                    }
                    return false;
                }
            }
        }

        if (want) {
            if (elapsed_ms(last_progress) >= m_config.write_timeout_ms) {
                LOG_WARN("Write to %s stalled for %d ms", link.peer.c_str(), m_config.write_timeout_ms);
                return false;
            }
            wait_fd(link.fd, want, POLL_SLICE_MS);
            continue;
        }

        done += n;
        last_progress = SteadyClock::now();
    }

    return true;
}

void TransportChannel::queue_state_locked(bool connected) {
    if (m_connected.exchange(connected) == connected) {
        return;
    }
    m_state_events.push_back(connected);
}

void TransportChannel::deliver_state_events() {
    std::unique_lock<std::mutex> lock(m_link_mutex);
    if (m_delivering_state) {
        // The thread already delivering picks these up
        return;
    }
    m_delivering_state = true;

    while (!m_state_events.empty()) {
        const bool connected = m_state_events.front();
        m_state_events.pop_front();
        lock.unlock();

        std::vector<StateHandler> handlers;
        {
            std::lock_guard<std::mutex> handler_lock(m_handler_mutex);
            handlers = m_state_handlers;
        }
        for (auto& handler : handlers) {
            try {
                handler(connected);
            } catch (const std::exception& e) {
                LOG_ERROR("Connection state handler threw: %s", e.what());
            }
        }

        lock.lock();
    }
    m_delivering_state = false;
}

void TransportChannel::dispatch(const TransportMessage& message) {
    std::vector<std::function<void(const TransportMessage&)>> handlers;
    {
        std::lock_guard<std::mutex> lock(m_handler_mutex);
        handlers = m_handlers[message.index()];
    }

    if (handlers.empty()) {
        LOG_DEBUG("No handler for %s", message_type_name(message_type_of(message)));
        return;
    }

    for (auto& handler : handlers) {
        try {
            handler(message);
        } catch (const std::exception& e) {
            LOG_ERROR("Handler for %s threw: %s", message_type_name(message_type_of(message)), e.what());
        }
    }
}

}  // namespace deskstream

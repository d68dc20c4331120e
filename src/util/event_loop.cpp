#include "event_loop.hpp"
#include "logger.hpp"
#include <exception>

namespace deskstream {

struct TimerData {
    std::function<void()> callback;
    EventLoop* loop;
};

static void timer_callback(uv_timer_t* handle) {
    TimerData* data = static_cast<TimerData*>(handle->data);
    if (data && data->callback) {
        data->callback();
    }
}

static void timer_close_callback(uv_handle_t* handle) {
    TimerData* data = static_cast<TimerData*>(handle->data);
    delete data;
    delete reinterpret_cast<uv_timer_t*>(handle);
}

static void close_any(uv_handle_t* handle, void*) {
    if (uv_is_closing(handle)) {
        return;
    }
    if (handle->type == UV_TIMER) {
        uv_close(handle, timer_close_callback);
    } else {
        uv_close(handle, nullptr);
    }
}

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    if (m_loop) {
        // Close remaining handles and let their close callbacks run
        uv_walk(m_loop, close_any, nullptr);
        uv_run(m_loop, UV_RUN_DEFAULT);
        if (uv_loop_close(m_loop) != 0) {
            LOG_WARN("Event loop closed with live handles");
        }
        delete m_loop;
    }
}

bool EventLoop::init() {
    m_loop = new uv_loop_t;
    if (uv_loop_init(m_loop) != 0) {
        LOG_ERROR("Failed to initialize event loop");
        delete m_loop;
        m_loop = nullptr;
        return false;
    }

    if (uv_async_init(m_loop, &m_async, &EventLoop::on_async) != 0) {
        LOG_ERROR("Failed to initialize event loop wakeup handle");
        uv_loop_close(m_loop);
        delete m_loop;
        m_loop = nullptr;
        return false;
    }
    m_async.data = this;
    return true;
}

void* EventLoop::add_timer(uint64_t timeout_ms, uint64_t repeat_ms, std::function<void()> callback) {
    if (!m_loop) return nullptr;

    uv_timer_t* timer = new uv_timer_t;
    TimerData* data = new TimerData{std::move(callback), this};

    uv_timer_init(m_loop, timer);
    timer->data = data;

    uv_timer_start(timer, timer_callback, timeout_ms, repeat_ms);

    return timer;
}

void EventLoop::remove_timer(void* handle) {
    if (!handle) return;

    uv_timer_t* timer = static_cast<uv_timer_t*>(handle);
    uv_timer_stop(timer);
    uv_close(reinterpret_cast<uv_handle_t*>(timer), timer_close_callback);
}

bool EventLoop::set_timer_repeat(void* handle, uint64_t repeat_ms) {
    if (!handle) return false;

    uv_timer_t* timer = static_cast<uv_timer_t*>(handle);
    if (uv_timer_get_repeat(timer) == repeat_ms) {
        return true;
    }
    uv_timer_set_repeat(timer, repeat_ms);
    return uv_timer_again(timer) == 0;
}

void EventLoop::post(std::function<void()> callback) {
    if (!m_loop) return;

    {
        std::lock_guard<std::mutex> lock(m_post_mutex);
        m_posted.push_back(std::move(callback));
    }
    uv_async_send(&m_async);
}

void EventLoop::run() {
    if (!m_loop || m_stop_requested) return;
    uv_run(m_loop, UV_RUN_DEFAULT);
}

void EventLoop::stop() {
    if (m_loop) {
        m_stop_requested = true;
        uv_async_send(&m_async);
    }
}

void EventLoop::on_async(uv_async_t* handle) {
    EventLoop* self = static_cast<EventLoop*>(handle->data);
    self->drain_posted();
    if (self->m_stop_requested) {
        uv_stop(self->m_loop);
    }
}

void EventLoop::drain_posted() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_post_mutex);
        callbacks.swap(m_posted);
    }

    for (auto& callback : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            LOG_ERROR("Posted callback threw: %s", e.what());
        }
    }
}

}  // namespace deskstream

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>
#include <uv.h>

namespace deskstream {

class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Initialize
    bool init();

    // Add timer callback (returns handle for cancellation). Loop thread only.
    void* add_timer(uint64_t timeout_ms, uint64_t repeat_ms, std::function<void()> callback);

    // Remove timer. Safe from inside the timer's own callback.
    void remove_timer(void* handle);

    // Change the repeat interval and restart the countdown with it
    bool set_timer_repeat(void* handle, uint64_t repeat_ms);

    // Queue a callback for the loop thread. Callable from any thread.
    void post(std::function<void()> callback);

    // Run event loop (blocking) until stop()
    void run();

    // Stop event loop. Callable from any thread or a signal handler.
    void stop();

private:
    static void on_async(uv_async_t* handle);
    void drain_posted();

    uv_loop_t* m_loop = nullptr;
    uv_async_t m_async;
    std::atomic<bool> m_stop_requested{false};

    std::mutex m_post_mutex;
    std::vector<std::function<void()>> m_posted;
};

}  // namespace deskstream

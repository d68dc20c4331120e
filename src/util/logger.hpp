#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace deskstream {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    NONE
};

// Printf-style logger shared by the host, the viewer and the channel
// threads. Lines look like:
//   [12:04:31.250] [WARN] [t2] Send queue to 10.0.0.5 full for 2000 ms
// where tN is a small per-thread number assigned on first use.
class Logger {
public:
    static void set_level(LogLevel level) { s_level = level; }

    // CLI mapping: 0 = WARN, 1 (-v) = INFO, 2+ (-vv) = DEBUG
    static void set_verbosity(int verbosity) {
        if (verbosity >= 2) {
            set_level(LogLevel::DEBUG);
        } else if (verbosity == 1) {
            set_level(LogLevel::INFO);
        } else {
            set_level(LogLevel::WARN);
        }
    }

    static void debug(const char* fmt, ...) {
        if (s_level <= LogLevel::DEBUG) {
            va_list args;
            va_start(args, fmt);
            log_impl("DEBUG", fmt, args);
            va_end(args);
        }
    }

    static void info(const char* fmt, ...) {
        if (s_level <= LogLevel::INFO) {
            va_list args;
            va_start(args, fmt);
            log_impl("INFO", fmt, args);
            va_end(args);
        }
    }

    static void warn(const char* fmt, ...) {
        if (s_level <= LogLevel::WARN) {
            va_list args;
            va_start(args, fmt);
            log_impl("WARN", fmt, args);
            va_end(args);
        }
    }

    static void error(const char* fmt, ...) {
        if (s_level <= LogLevel::ERROR) {
            va_list args;
            va_start(args, fmt);
            log_impl("ERROR", fmt, args);
            va_end(args);
        }
    }

private:
    static inline std::atomic<LogLevel> s_level{LogLevel::WARN};
    static inline std::mutex s_mutex;
    static inline std::atomic<int> s_next_thread{0};

    static int thread_tag() {
        thread_local const int tag = s_next_thread++;
        return tag;
    }

    static void log_impl(const char* level, const char* fmt, va_list args) {
        const auto now = std::chrono::system_clock::now();
        const time_t secs = std::chrono::system_clock::to_time_t(now);
        const int millis = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

        struct tm tm_info;
        localtime_r(&secs, &tm_info);
        char time_buf[16];
        strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_info);

        const int tag = thread_tag();

        std::lock_guard<std::mutex> lock(s_mutex);
        fprintf(stderr, "[%s.%03d] [%s] [t%d] ", time_buf, millis, level, tag);
        vfprintf(stderr, fmt, args);
        fputc('\n', stderr);
    }
};

#define LOG_DEBUG(...) deskstream::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  deskstream::Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  deskstream::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) deskstream::Logger::error(__VA_ARGS__)

}  // namespace deskstream

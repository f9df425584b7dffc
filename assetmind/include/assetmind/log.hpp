#pragma once
// Logging: component-tagged lines on stderr
//
// log_warn and log_info always print (info can be silenced with set_quiet).
// log_debug prints only in verbose mode, prefixed with a wall-clock time.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace assetmind {

namespace detail {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline std::atomic<bool>& quiet_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline void vlog(const char* prefix, const char* component, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(log_mutex());
    if (prefix) std::fputs(prefix, stderr);
    std::fprintf(stderr, "[%s] ", component);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace detail

inline void set_verbose(bool on) { detail::verbose_flag().store(on); }
inline bool verbose() { return detail::verbose_flag().load(); }
inline void set_quiet(bool on) { detail::quiet_flag().store(on); }

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);
    char prefix[48];
    std::snprintf(prefix, sizeof(prefix), "[%s.%03d]", time_buf, static_cast<int>(now_ms.count()));

    va_list args;
    va_start(args, fmt);
    detail::vlog(prefix, component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    if (detail::quiet_flag().load()) return;
    va_list args;
    va_start(args, fmt);
    detail::vlog(nullptr, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::vlog("WARN ", component, fmt, args);
    va_end(args);
}

} // namespace assetmind

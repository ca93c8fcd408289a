// =============================================================================
// PortalBridge - Logging
// =============================================================================
// PLOG_INFO("tag", "fmt %s", arg) -> stderr, and log.path when it opened.
// Line: "HH:MM:SS.mmm [LEVEL] [tag] (Ttid) message"
// =============================================================================
#pragma once
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

#include <sys/syscall.h>
#include <unistd.h>

namespace portal::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

namespace detail {

inline std::atomic<Level> min_level{Level::Info};
inline std::mutex sink_mutex;
inline FILE* sink_file = nullptr;

inline const char* name(Level l) {
    static const char* const names[] = {"TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};
    const int i = static_cast<int>(l);
    return (i >= 0 && i < 6) ? names[i] : "?????";
}

} // namespace detail

// "debug", "WARN", "warning"... 不明な値は Info
inline Level levelFromString(const std::string& s) {
    std::string v;
    for (char c : s) v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "trace") return Level::Trace;
    if (v == "debug") return Level::Debug;
    if (v == "warn" || v == "warning") return Level::Warn;
    if (v == "error") return Level::Error;
    if (v == "fatal") return Level::Fatal;
    return Level::Info;
}

inline void setLogLevel(Level l) { detail::min_level.store(l); }

// デーモン再起動で前回のログを消さないよう追記
inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(detail::sink_mutex);
    if (detail::sink_file) fclose(detail::sink_file);
    detail::sink_file = fopen(path, "a");
    return detail::sink_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(detail::sink_mutex);
    if (detail::sink_file) {
        fclose(detail::sink_file);
        detail::sink_file = nullptr;
    }
}

inline void write(Level level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < detail::min_level.load(std::memory_order_relaxed)) return;

    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const int ms = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    struct tm local;
    localtime_r(&secs, &local);

    char line[2200];
    int n = snprintf(line, sizeof(line), "%02d:%02d:%02d.%03d [%s] [%s] (T%ld) ",
                     local.tm_hour, local.tm_min, local.tm_sec, ms,
                     detail::name(level), tag, static_cast<long>(::syscall(SYS_gettid)));
    if (n < 0) return;
    if (static_cast<size_t>(n) < sizeof(line)) {
        va_list args;
        va_start(args, fmt);
        vsnprintf(line + n, sizeof(line) - static_cast<size_t>(n), fmt, args);
        va_end(args);
    }

    std::lock_guard<std::mutex> lock(detail::sink_mutex);
    fprintf(stderr, "%s\n", line);
    if (detail::sink_file) {
        fprintf(detail::sink_file, "%s\n", line);
        fflush(detail::sink_file);
    }
}

} // namespace portal::log

#define PLOG_DEBUG(tag, fmt, ...) portal::log::write(portal::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define PLOG_INFO(tag, fmt, ...)  portal::log::write(portal::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define PLOG_WARN(tag, fmt, ...)  portal::log::write(portal::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define PLOG_ERROR(tag, fmt, ...) portal::log::write(portal::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define PLOG_FATAL(tag, fmt, ...) portal::log::write(portal::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)

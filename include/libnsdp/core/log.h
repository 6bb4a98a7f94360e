#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <functional>
#include <cstdio>
#include <cstdarg>

namespace libnsdp {

enum class LogLevel : uint8_t {
    Trace = 0,   ///< every request and discarded datagram
    Debug = 1,   ///< findings, liveness markers, identity lookups
    Info  = 2,   ///< per-batch and per-scan progress
    Warn  = 3,
    Error = 4,
    None  = 5,
};

/// Log sink; `file` is the source file name without its directory
using LogCallback = std::function<void(LogLevel level, const char* file, int line, const std::string& msg)>;

/// Process-wide logger. Messages below the current level are dropped before
/// formatting. Without a callback, lines go to stderr as
/// "[nsdp:LVL] file:line: message".
class Logger {
public:
    static Logger& instance() {
        static Logger log;
        return log;
    }

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    /// True when a message at `level` would be emitted
    bool enabled(LogLevel level) const { return level >= level_ && level != LogLevel::None; }

    void setCallback(LogCallback cb) { callback_ = std::move(cb); }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::Trace: return "TRC";
            case LogLevel::Debug: return "DBG";
            case LogLevel::Info:  return "INF";
            case LogLevel::Warn:  return "WRN";
            case LogLevel::Error: return "ERR";
            default:              return "???";
        }
    }

    void log(LogLevel level, const char* file, int line, const char* fmt, ...) {
        if (!enabled(level)) return;

        char buf[1024];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buf, sizeof(buf), fmt, args);
        va_end(args);

        const char* slash = std::strrchr(file, '/');
        const char* base = slash ? slash + 1 : file;

        if (callback_) {
            callback_(level, base, line, std::string(buf));
        } else {
            fprintf(stderr, "[nsdp:%s] %s:%d: %s\n", levelName(level), base, line, buf);
        }
    }

private:
    Logger() = default;
    LogLevel level_ = LogLevel::Info;
    LogCallback callback_;
};

// ── Variadic log macros ─────────────────────────────

namespace detail {

template <typename... Args>
inline void logFwd(LogLevel level, const char* file, int line,
                   const char* fmt, Args&&... args) {
    Logger::instance().log(level, file, line, fmt, std::forward<Args>(args)...);
}

/// Plain message: never treated as a format string
inline void logFwd(LogLevel level, const char* file, int line,
                   const char* msg) {
    Logger::instance().log(level, file, line, "%s", msg);
}

} // namespace detail

#define LIBNSDP_LOG(level, ...)  ::libnsdp::detail::logFwd(level, __FILE__, __LINE__, __VA_ARGS__)

#define LIBNSDP_TRACE(...) LIBNSDP_LOG(::libnsdp::LogLevel::Trace, __VA_ARGS__)
#define LIBNSDP_DEBUG(...) LIBNSDP_LOG(::libnsdp::LogLevel::Debug, __VA_ARGS__)
#define LIBNSDP_INFO(...)  LIBNSDP_LOG(::libnsdp::LogLevel::Info,  __VA_ARGS__)
#define LIBNSDP_WARN(...)  LIBNSDP_LOG(::libnsdp::LogLevel::Warn,  __VA_ARGS__)
#define LIBNSDP_ERROR(...) LIBNSDP_LOG(::libnsdp::LogLevel::Error, __VA_ARGS__)

} // namespace libnsdp

///////////////////////////////////////////////////////////////////////////////
// common.h -- LinuxPlay shared utilities
//
// Provides:
//   - POSIX socket helpers
//   - Printf-based logging macro with timestamp and severity
//   - High-resolution microsecond timestamp helper
//   - Local network interface enumeration
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <chrono>
#include <string>
#include <vector>
#include <mutex>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

inline int lp_close_socket(int fd) { return ::close(fd); }

inline bool lp_set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

inline int lp_socket_error() { return errno; }

namespace lp {

// ---------------------------------------------------------------------------
// Log levels
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERR   = 4
};

/// Current global log level.  Messages below this level are suppressed.
/// Defaults to INFO; callers may lower it for debugging.
inline LogLevel& globalLogLevel() {
    static LogLevel level = LogLevel::INFO;
    return level;
}

inline const char* logLevelStr(LogLevel lv) {
    switch (lv) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERR:   return "ERROR";
    }
    return "?????";
}

/// Parse a level name ("trace", "debug", "info", "warn", "error").
/// Unknown names leave \p out untouched and return false.
inline bool parseLogLevel(const std::string& name, LogLevel& out) {
    if (name == "trace") { out = LogLevel::TRACE; return true; }
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "info")  { out = LogLevel::INFO;  return true; }
    if (name == "warn")  { out = LogLevel::WARN;  return true; }
    if (name == "error") { out = LogLevel::ERR;   return true; }
    return false;
}

/// Thread-safe printf-style log.  Called via LP_LOG macro below.
inline void logMessage(LogLevel level, const char* file, int line,
                       const char* fmt, ...) {
    if (level < globalLogLevel()) return;

    // Timestamp: seconds since epoch with microsecond fraction
    auto now  = std::chrono::system_clock::now();
    auto usec = std::chrono::duration_cast<std::chrono::microseconds>(
                    now.time_since_epoch()).count();
    long sec  = static_cast<long>(usec / 1'000'000);
    long frac = static_cast<long>(usec % 1'000'000);

    // Extract just the filename from path
    const char* base = file;
    for (const char* p = file; *p; ++p) {
        if (*p == '/') base = p + 1;
    }

    // Serialize output so lines don't interleave
    static std::mutex mtx;
    std::lock_guard<std::mutex> lock(mtx);

    std::fprintf(stderr, "[%ld.%06ld] [%s] %s:%d  ",
                 sec, frac, logLevelStr(level), base, line);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);

    std::fputc('\n', stderr);
    std::fflush(stderr);
}

// ---------------------------------------------------------------------------
// LP_LOG macro
// Usage: LP_LOG(INFO, "received %d bytes from %s", n, addr.c_str());
// ---------------------------------------------------------------------------
#define LP_LOG(level, fmt, ...) \
    ::lp::logMessage(::lp::LogLevel::level, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

// ---------------------------------------------------------------------------
// Error codes returned by socket-level helpers
// ---------------------------------------------------------------------------
enum class ErrorCode : int {
    OK              =  0,
    SOCKET_FAIL     = -1,
    BIND_FAIL       = -2,
    TIMEOUT         = -3,
    HANDSHAKE_FAIL  = -4,
    INVALID_PACKET  = -9,
    UNKNOWN         = -100,
};

// ---------------------------------------------------------------------------
// High-resolution microsecond timestamp (monotonic clock)
// ---------------------------------------------------------------------------
inline uint64_t getTimestampUs() {
    auto now = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            now.time_since_epoch()).count());
}

/// Dotted-quad form of an IPv4 socket address.
inline std::string addrToString(const sockaddr_in& addr) {
    char ipStr[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr));
    return ipStr;
}

} // namespace lp

#include "util/logger.hpp"

#include "util/string_utils.hpp"

#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace logfetch {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warning";
        case LogLevel::Error: return "error";
        default:              return "log";
    }
}

void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}
} // namespace

bool ParseLogLevel(std::string_view s, LogLevel& out) {
    const std::string v = ToLower(s);
    if (v == "debug") {
        out = LogLevel::Debug;
    } else if (v == "info") {
        out = LogLevel::Info;
    } else if (v == "warning" || v == "warn") {
        out = LogLevel::Warn;
    } else if (v == "error") {
        out = LogLevel::Error;
    } else if (v == "none") {
        out = LogLevel::None;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (lvl < g_level) return;

    // Diagnostic stream only; stdout carries the rendered logs.
    std::fflush(stdout);

    // Timestamps and source locations only in debug mode, so regular runs
    // print plain "warning: ..." / "error: ..." lines.
    if (g_level == LogLevel::Debug) {
        char ts[32]{};
        FormatTimestamp(ts, sizeof(ts));
        if (ts[0] != '\0') {
            std::fprintf(stderr, "[%s] ", ts);
        }
        const char* base = BaseName(file);
        if (base && line > 0) {
            std::fprintf(stderr, "[%s:%d] ", base, line);
        }
    }
    std::fprintf(stderr, "%s: ", ToStr(lvl));
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");
}

} // namespace logfetch

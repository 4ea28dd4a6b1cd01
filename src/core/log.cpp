#include "scanport/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <sys/time.h>
#include <unistd.h>

namespace scanport::core {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_log_mutex;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[1m\033[34m";
        case LogLevel::Info: return "\033[1m\033[32m";
        case LogLevel::Warn: return "\033[1m\033[33m";
        case LogLevel::Error: return "\033[1m\033[31m";
    }
    return "";
}

} // namespace

void log_set_level(LogLevel level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

void log_write(LogLevel level, const char* tag, const char* fmt, ...) noexcept {
    if (static_cast<u8>(level) < static_cast<u8>(log_level())) {
        return;
    }

    char msg[2048];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    struct timeval tv{};
    gettimeofday(&tv, nullptr);
    struct tm tm_local{};
    localtime_r(&tv.tv_sec, &tm_local);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_local);

    const bool color = isatty(STDERR_FILENO) == 1;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (color) {
        std::fprintf(stderr, "%s,%03ld [%s%s\033[0m] %s: %s\n",
                     ts, static_cast<long>(tv.tv_usec / 1000),
                     level_color(level), level_name(level),
                     tag ? tag : "scanport", msg);
    } else {
        std::fprintf(stderr, "%s,%03ld [%s] %s: %s\n",
                     ts, static_cast<long>(tv.tv_usec / 1000),
                     level_name(level),
                     tag ? tag : "scanport", msg);
    }
}

u32 format_size(u64 bytes, char* out, std::size_t out_size) noexcept {
    if (out == nullptr || out_size == 0) {
        return 0;
    }
    static const char* const units[] = {"", "Ki", "Mi", "Gi", "Ti", "Pi", "Ei", "Zi"};

    double num = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (num < 1024.0) {
            const int n = std::snprintf(out, out_size, "%3.1f%sB", num, unit);
            return n < 0 ? 0 : static_cast<u32>(n);
        }
        num /= 1024.0;
    }
    const int n = std::snprintf(out, out_size, "%.1fYiB", num);
    return n < 0 ? 0 : static_cast<u32>(n);
}

} // namespace scanport::core

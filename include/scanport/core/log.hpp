#pragma once

#include <cstddef>

#include "scanport/core/types.hpp"

namespace scanport::core {

    enum class LogLevel : u8 {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
    };

    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;

    // Writes "<time> [LEVEL] <tag>: <message>" to stderr. Lines from
    // concurrent sessions never interleave. A null tag logs as "scanport".
    void log_write(LogLevel level, const char* tag, const char* fmt, ...) noexcept
        __attribute__((format(printf, 3, 4)));

#define SCANPORT_LOG_DEBUG(tag, ...) ::scanport::core::log_write(::scanport::core::LogLevel::Debug, (tag), __VA_ARGS__)
#define SCANPORT_LOG_INFO(tag, ...) ::scanport::core::log_write(::scanport::core::LogLevel::Info, (tag), __VA_ARGS__)
#define SCANPORT_LOG_WARN(tag, ...) ::scanport::core::log_write(::scanport::core::LogLevel::Warn, (tag), __VA_ARGS__)
#define SCANPORT_LOG_ERROR(tag, ...) ::scanport::core::log_write(::scanport::core::LogLevel::Error, (tag), __VA_ARGS__)

    // Human-readable byte count with binary prefixes: "512.0B", "1.5KiB", "3.0GiB".
    // Returns the number of chars written (excluding the terminator).
    u32 format_size(u64 bytes, char* out, std::size_t out_size) noexcept;

} // namespace scanport::core

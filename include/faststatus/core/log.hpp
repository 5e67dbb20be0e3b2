#pragma once

#include "faststatus/core/errors.hpp"
#include "faststatus/core/types.hpp"

namespace faststatus::core {

    enum class LogLevel : u8 {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4,
    };

    // Initial level comes from FASTSTATUS_LOG_LEVEL (debug|info|warn|error|off),
    // default warn.
    [[nodiscard]] LogLevel log_level() noexcept;
    void log_set_level(LogLevel level) noexcept;

    [[nodiscard]] bool log_enabled(LogLevel level) noexcept;

    // Writes "<level>: <message>\n" to stderr.
    void log_write(LogLevel level, const char* fmt, ...) noexcept
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

    // "<level>: <context> failed (code=..., domain=..., field=..., cause=..., aux=...)"
    void log_status(LogLevel level, const char* context, Status s) noexcept;

    [[nodiscard]] bool log_level_from_text(const char* text, LogLevel* out) noexcept;

} // namespace faststatus::core

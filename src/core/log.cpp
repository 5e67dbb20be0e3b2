#include "faststatus/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <strings.h>

namespace faststatus::core {
    namespace {
        LogLevel initial_level() noexcept {
            LogLevel level = LogLevel::Warn;
            const char* env = std::getenv("FASTSTATUS_LOG_LEVEL");
            if (env && env[0] != '\0') {
                if (!log_level_from_text(env, &level)) {
                    std::fprintf(stderr, "warn: ignoring unknown FASTSTATUS_LOG_LEVEL=%s\n", env);
                    level = LogLevel::Warn;
                }
            }
            return level;
        }

        std::atomic<u8>& level_slot() noexcept {
            static std::atomic<u8> slot{static_cast<u8>(initial_level())};
            return slot;
        }

        const char* level_prefix(LogLevel level) noexcept {
            switch (level) {
                case LogLevel::Debug: return "debug";
                case LogLevel::Info: return "info";
                case LogLevel::Warn: return "warn";
                case LogLevel::Error: return "error";
                case LogLevel::Off: return "off";
            }
            return "log";
        }
    } // namespace

    bool log_level_from_text(const char* text, LogLevel* out) noexcept {
        if (!text || !out) {
            return false;
        }
        static constexpr LogLevel kLevels[] = {
            LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off,
        };
        for (LogLevel l : kLevels) {
            if (strcasecmp(text, level_prefix(l)) == 0) {
                *out = l;
                return true;
            }
        }
        return false;
    }

    LogLevel log_level() noexcept {
        return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
    }

    void log_set_level(LogLevel level) noexcept {
        level_slot().store(static_cast<u8>(level), std::memory_order_relaxed);
    }

    bool log_enabled(LogLevel level) noexcept {
        return level != LogLevel::Off && static_cast<u8>(level) >= static_cast<u8>(log_level());
    }

    void log_write(LogLevel level, const char* fmt, ...) noexcept {
        if (!fmt || !log_enabled(level)) {
            return;
        }
        // Format into one buffer so concurrent writers don't interleave within a line.
        char line[1024];
        int off = std::snprintf(line, sizeof(line), "%s: ", level_prefix(level));
        if (off < 0) {
            return;
        }

        va_list args;
        va_start(args, fmt);
        const int n = std::vsnprintf(line + off, sizeof(line) - static_cast<size_t>(off), fmt, args);
        va_end(args);
        if (n < 0) {
            return;
        }

        std::fprintf(stderr, "%s\n", line);
    }

    void log_status(LogLevel level, const char* context, Status s) noexcept {
        log_write(level,
                  "%s failed (code=%s, domain=%s, field=%s, cause=%s, aux=%u)",
                  context ? context : "operation",
                  status_code_name(s.code),
                  status_domain_name(s.domain),
                  status_field_name(s.field),
                  status_code_name(s.cause),
                  s.aux);
    }

} // namespace faststatus::core

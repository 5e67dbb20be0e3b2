#pragma once

#include <string>
#include <type_traits>

#include "faststatus/core/errors.hpp"
#include "faststatus/core/types.hpp"

namespace faststatus::core {

    // An absolute instant plus the UTC offset it was recorded in.
    // The all-zero value (1970-01-01T00:00:00Z) means "unset".
    struct Timestamp {
        i64 seconds{0};        // Unix seconds (UTC)
        u32 nanos{0};          // 0..999999999
        i16 offset_minutes{0}; // -1439..1439
    };

    inline constexpr u32 kNanosPerSecond = 1000000000u;
    inline constexpr i16 kMaxOffsetMinutes = 24 * 60 - 1;

    // Layout (big-endian): 0..7 seconds(i64), 8..11 nanos(u32), 12..13 offset minutes(i16).
    inline constexpr u32 kTimestampBinaryBytes = 14;

    [[nodiscard]] constexpr bool timestamp_is_zero(const Timestamp& t) noexcept {
        return t.seconds == 0 && t.nanos == 0;
    }

    // Local wall-clock bounds of the text form: 0000-01-01T00:00:00 .. 9999-12-31T23:59:59.
    inline constexpr i64 kMinLocalSeconds = -62167219200;
    inline constexpr i64 kMaxLocalSeconds = 253402300799;

    // Also requires the local time (seconds shifted by the offset) to have a
    // four-digit year, so every valid value has a text form.
    [[nodiscard]] constexpr bool timestamp_valid(const Timestamp& t) noexcept {
        if (t.nanos >= kNanosPerSecond || t.offset_minutes < -kMaxOffsetMinutes || t.offset_minutes > kMaxOffsetMinutes) {
            return false;
        }
        const i64 slack = static_cast<i64>(kMaxOffsetMinutes) * 60;
        if (t.seconds < kMinLocalSeconds - slack || t.seconds > kMaxLocalSeconds + slack) {
            return false;
        }
        const i64 local = t.seconds + static_cast<i64>(t.offset_minutes) * 60;
        return local >= kMinLocalSeconds && local <= kMaxLocalSeconds;
    }

    // Instant comparisons ignore the offset annotation.
    [[nodiscard]] constexpr bool instant_equal(const Timestamp& a, const Timestamp& b) noexcept {
        return a.seconds == b.seconds && a.nanos == b.nanos;
    }

    [[nodiscard]] constexpr bool instant_after(const Timestamp& a, const Timestamp& b) noexcept {
        return a.seconds > b.seconds || (a.seconds == b.seconds && a.nanos > b.nanos);
    }

    [[nodiscard]] Timestamp timestamp_now() noexcept;

    // Same instant, presented in UTC.
    [[nodiscard]] constexpr Timestamp timestamp_utc(Timestamp t) noexcept {
        t.offset_minutes = 0;
        return t;
    }

    // RFC 3339: YYYY-MM-DDTHH:MM:SS[.fraction](Z|+hh:mm|-hh:mm).
    // The fraction is written without trailing zeros and omitted when zero.
    // Range if the timestamp is not valid (including a local year outside 0000..9999).
    [[nodiscard]] Status timestamp_to_text(const Timestamp& t, std::string* out) noexcept;

    // Strict RFC 3339 parse; Format on any deviation.
    [[nodiscard]] Status timestamp_from_text(const char* txt, u32 len, Timestamp* out) noexcept;

    // Returns bytes written (0 on failure).
    [[nodiscard]] u32 timestamp_write_binary(const Timestamp& t, BufferMut out) noexcept;

    // Length if shorter than kTimestampBinaryBytes, Format if !timestamp_valid.
    [[nodiscard]] Status timestamp_read_binary(BufferView in, Timestamp* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Timestamp>);
    static_assert(std::is_standard_layout_v<Timestamp>);

} // namespace faststatus::core

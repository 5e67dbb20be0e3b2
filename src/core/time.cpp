#include "faststatus/core/time.hpp"

#include <chrono>
#include <cstdio>

namespace faststatus::core {
    namespace {
        constexpr i64 kSecondsPerDay = 86400;

        void put_u16_be(u8* p, u16 v) noexcept {
            p[0] = static_cast<u8>((v >> 8) & 0xffu);
            p[1] = static_cast<u8>((v >> 0) & 0xffu);
        }

        void put_u32_be(u8* p, u32 v) noexcept {
            p[0] = static_cast<u8>((v >> 24) & 0xffu);
            p[1] = static_cast<u8>((v >> 16) & 0xffu);
            p[2] = static_cast<u8>((v >> 8) & 0xffu);
            p[3] = static_cast<u8>((v >> 0) & 0xffu);
        }

        void put_u64_be(u8* p, u64 v) noexcept {
            for (int i = 0; i < 8; ++i) {
                p[i] = static_cast<u8>((v >> (56 - 8 * i)) & 0xffu);
            }
        }

        u16 get_u16_be(const u8* p) noexcept {
            return static_cast<u16>((static_cast<u16>(p[0]) << 8) | static_cast<u16>(p[1]));
        }

        u32 get_u32_be(const u8* p) noexcept {
            return (static_cast<u32>(p[0]) << 24) |
                   (static_cast<u32>(p[1]) << 16) |
                   (static_cast<u32>(p[2]) << 8) |
                   (static_cast<u32>(p[3]) << 0);
        }

        u64 get_u64_be(const u8* p) noexcept {
            u64 v = 0;
            for (int i = 0; i < 8; ++i) {
                v = (v << 8) | static_cast<u64>(p[i]);
            }
            return v;
        }

        // Proleptic Gregorian calendar <-> days since 1970-01-01.
        constexpr i64 days_from_civil(i64 y, int m, int d) noexcept {
            y -= m <= 2 ? 1 : 0;
            const i64 era = (y >= 0 ? y : y - 399) / 400;
            const i64 yoe = y - era * 400;
            const i64 doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            const i64 doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        struct Civil {
            i64 year;
            int month;
            int day;
        };

        constexpr Civil civil_from_days(i64 z) noexcept {
            z += 719468;
            const i64 era = (z >= 0 ? z : z - 146096) / 146097;
            const i64 doe = z - era * 146097;
            const i64 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const i64 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const i64 mp = (5 * doy + 2) / 153;
            const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
            const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
            return Civil{yoe + era * 400 + (m <= 2 ? 1 : 0), m, d};
        }

        static_assert(days_from_civil(1970, 1, 1) == 0);
        static_assert(days_from_civil(2000, 3, 1) == 11017);
        static_assert(days_from_civil(0, 1, 1) * kSecondsPerDay == kMinLocalSeconds);
        static_assert(days_from_civil(10000, 1, 1) * kSecondsPerDay - 1 == kMaxLocalSeconds);

        constexpr bool is_leap(i64 y) noexcept {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        constexpr int days_in_month(i64 y, int m) noexcept {
            constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
        }

        constexpr i64 floor_div(i64 a, i64 b) noexcept {
            const i64 q = a / b;
            return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
        }

        // Reads exactly n decimal digits.
        bool read_digits(const char* p, u32 n, int* out) noexcept {
            int v = 0;
            for (u32 i = 0; i < n; ++i) {
                const char c = p[i];
                if (c < '0' || c > '9') {
                    return false;
                }
                v = v * 10 + (c - '0');
            }
            *out = v;
            return true;
        }

        Status format_error() noexcept {
            return make_status(StatusDomain::Codec, StatusCode::Format);
        }
    } // namespace

    Timestamp timestamp_now() noexcept {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
        Timestamp t{};
        t.seconds = floor_div(static_cast<i64>(ns), kNanosPerSecond);
        t.nanos = static_cast<u32>(static_cast<i64>(ns) - t.seconds * kNanosPerSecond);
        return t;
    }

    Status timestamp_to_text(const Timestamp& t, std::string* out) noexcept {
        if (!out) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        // Bounds seconds, so the arithmetic below cannot overflow.
        if (!timestamp_valid(t)) {
            return make_status(StatusDomain::Codec, StatusCode::Range);
        }

        const i64 local = t.seconds + static_cast<i64>(t.offset_minutes) * 60;
        const i64 days = floor_div(local, kSecondsPerDay);
        const i64 sod = local - days * kSecondsPerDay;
        const Civil c = civil_from_days(days);

        char buf[40];
        int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                              static_cast<int>(c.year), c.month, c.day,
                              static_cast<int>(sod / 3600),
                              static_cast<int>((sod / 60) % 60),
                              static_cast<int>(sod % 60));

        if (t.nanos != 0) {
            char frac[10];
            std::snprintf(frac, sizeof(frac), "%09u", static_cast<unsigned>(t.nanos));
            int digits = 9;
            while (digits > 1 && frac[digits - 1] == '0') {
                --digits;
            }
            buf[n++] = '.';
            for (int i = 0; i < digits; ++i) {
                buf[n++] = frac[i];
            }
        }

        if (t.offset_minutes == 0) {
            buf[n++] = 'Z';
        } else {
            const int off = t.offset_minutes < 0 ? -t.offset_minutes : t.offset_minutes;
            n += std::snprintf(buf + n, sizeof(buf) - static_cast<size_t>(n), "%c%02d:%02d",
                               t.offset_minutes < 0 ? '-' : '+', off / 60, off % 60);
        }

        out->assign(buf, static_cast<size_t>(n));
        return ok_status();
    }

    Status timestamp_from_text(const char* txt, u32 len, Timestamp* out) noexcept {
        if (!out) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        // Shortest form: YYYY-MM-DDTHH:MM:SSZ
        if (!txt || len < 20) {
            return format_error();
        }

        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!read_digits(txt + 0, 4, &year) || txt[4] != '-' ||
            !read_digits(txt + 5, 2, &month) || txt[7] != '-' ||
            !read_digits(txt + 8, 2, &day) || txt[10] != 'T' ||
            !read_digits(txt + 11, 2, &hour) || txt[13] != ':' ||
            !read_digits(txt + 14, 2, &minute) || txt[16] != ':' ||
            !read_digits(txt + 17, 2, &second)) {
            return format_error();
        }
        if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
            hour > 23 || minute > 59 || second > 59) {
            return format_error();
        }

        u32 pos = 19;
        u32 nanos = 0;
        if (txt[pos] == '.') {
            ++pos;
            u32 digits = 0;
            while (pos < len && txt[pos] >= '0' && txt[pos] <= '9') {
                if (digits == 9) {
                    return format_error();
                }
                nanos = nanos * 10 + static_cast<u32>(txt[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                return format_error();
            }
            for (u32 i = digits; i < 9; ++i) {
                nanos *= 10;
            }
        }

        if (pos >= len) {
            return format_error();
        }

        int offset = 0;
        if (txt[pos] == 'Z') {
            ++pos;
        } else if (txt[pos] == '+' || txt[pos] == '-') {
            if (len - pos < 6) {
                return format_error();
            }
            int oh = 0, om = 0;
            if (!read_digits(txt + pos + 1, 2, &oh) || txt[pos + 3] != ':' ||
                !read_digits(txt + pos + 4, 2, &om) || oh > 23 || om > 59) {
                return format_error();
            }
            offset = oh * 60 + om;
            if (txt[pos] == '-') {
                offset = -offset;
            }
            pos += 6;
        } else {
            return format_error();
        }

        if (pos != len) {
            return format_error();
        }

        const i64 local = days_from_civil(year, month, day) * kSecondsPerDay +
                          static_cast<i64>(hour) * 3600 + minute * 60 + second;

        Timestamp t{};
        t.seconds = local - static_cast<i64>(offset) * 60;
        t.nanos = nanos;
        t.offset_minutes = static_cast<i16>(offset);
        *out = t;
        return ok_status();
    }

    u32 timestamp_write_binary(const Timestamp& t, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kTimestampBinaryBytes) {
            return 0;
        }
        put_u64_be(out.data + 0, static_cast<u64>(t.seconds));
        put_u32_be(out.data + 8, t.nanos);
        put_u16_be(out.data + 12, static_cast<u16>(t.offset_minutes));
        return kTimestampBinaryBytes;
    }

    Status timestamp_read_binary(BufferView in, Timestamp* out) noexcept {
        if (!out) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (in.data == nullptr || in.len < kTimestampBinaryBytes) {
            return make_status(StatusDomain::Codec, StatusCode::Length);
        }

        Timestamp t{};
        t.seconds = static_cast<i64>(get_u64_be(in.data + 0));
        t.nanos = get_u32_be(in.data + 8);
        t.offset_minutes = static_cast<i16>(get_u16_be(in.data + 12));
        if (!timestamp_valid(t)) {
            return format_error();
        }

        *out = t;
        return ok_status();
    }

} // namespace faststatus::core

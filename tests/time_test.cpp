#include <array>
#include <cstdint>
#include <cstring>
#include <string>

#include <gtest/gtest.h>

#include "faststatus/core/time.hpp"

using namespace faststatus::core;

namespace {

Timestamp parse(const char* txt) {
    Timestamp t{};
    const Status s = timestamp_from_text(txt, static_cast<u32>(std::strlen(txt)), &t);
    EXPECT_TRUE(is_ok(s)) << txt;
    return t;
}

Status parse_status(const char* txt) {
    Timestamp t{};
    return timestamp_from_text(txt, static_cast<u32>(std::strlen(txt)), &t);
}

std::string format(const Timestamp& t) {
    std::string out;
    EXPECT_TRUE(is_ok(timestamp_to_text(t, &out)));
    return out;
}

} // namespace

TEST(Timestamp, ParsesOffsetAndNormalizesInstant) {
    const Timestamp t = parse("2016-05-12T15:09:00-07:00");
    EXPECT_EQ(t.seconds, 1463090940);
    EXPECT_EQ(t.nanos, 0u);
    EXPECT_EQ(t.offset_minutes, -7 * 60);

    const Timestamp utc = parse("2016-05-12T22:09:00Z");
    EXPECT_TRUE(instant_equal(t, utc));
    EXPECT_EQ(utc.offset_minutes, 0);
}

TEST(Timestamp, FormatKeepsOffset) {
    EXPECT_EQ(format(parse("2016-05-12T15:09:00-07:00")), "2016-05-12T15:09:00-07:00");
    EXPECT_EQ(format(parse("2000-02-29T12:00:00+05:30")), "2000-02-29T12:00:00+05:30");
    EXPECT_EQ(format(timestamp_utc(parse("2016-05-12T15:09:00-07:00"))), "2016-05-12T22:09:00Z");
}

TEST(Timestamp, FractionTrimsTrailingZeros) {
    Timestamp t{};
    t.seconds = 1463090940;
    t.nanos = 500000000;
    EXPECT_EQ(format(t), "2016-05-12T22:09:00.5Z");

    t.nanos = 123456789;
    EXPECT_EQ(format(t), "2016-05-12T22:09:00.123456789Z");

    const Timestamp back = parse("2016-05-12T22:09:00.123456789Z");
    EXPECT_EQ(back.nanos, 123456789u);
}

TEST(Timestamp, NegativeSecondsBeforeEpoch) {
    const Timestamp t = parse("1969-12-31T23:59:59.5Z");
    EXPECT_EQ(t.seconds, -1);
    EXPECT_EQ(t.nanos, 500000000u);
    EXPECT_EQ(format(t), "1969-12-31T23:59:59.5Z");
}

TEST(Timestamp, CalendarExtremes) {
    EXPECT_EQ(parse("0001-01-01T00:00:00Z").seconds, -62135596800);
    EXPECT_EQ(parse("9999-12-31T23:59:59Z").seconds, 253402300799);

    Timestamp past_end{};
    past_end.seconds = 253402300800; // 10000-01-01
    std::string out;
    EXPECT_TRUE(is_range_error(timestamp_to_text(past_end, &out)));
}

TEST(Timestamp, ZeroValueFormatsAsEpoch) {
    EXPECT_EQ(format(Timestamp{}), "1970-01-01T00:00:00Z");
    EXPECT_TRUE(timestamp_is_zero(parse("1970-01-01T00:00:00Z")));
    EXPECT_TRUE(timestamp_is_zero(parse("1970-01-01T01:00:00+01:00")));
}

TEST(Timestamp, RejectsMalformedText) {
    const char* bad[] = {
        "",
        "2016-05-12",
        "2016-05-12 15:09:00Z",
        "2016-05-12T15:09:00",
        "2016-05-12T15:09:00z",
        "2016-13-12T15:09:00Z",
        "2015-02-29T15:09:00Z",
        "2016-05-12T24:00:00Z",
        "2016-05-12T15:60:00Z",
        "2016-05-12T15:09:60Z",
        "2016-05-12T15:09:00.Z",
        "2016-05-12T15:09:00.1234567890Z",
        "2016-05-12T15:09:00+0700",
        "2016-05-12T15:09:00+24:00",
        "2016-05-12T15:09:00-07:00 ",
        "16-05-12T15:09:00Z",
    };
    for (const char* txt : bad) {
        EXPECT_TRUE(is_format_error(parse_status(txt))) << txt;
    }
}

TEST(Timestamp, Ordering) {
    const Timestamp early = parse("2016-05-12T15:00:00-07:00");
    const Timestamp late = parse("2016-05-12T15:15:00-07:00");
    EXPECT_TRUE(instant_after(late, early));
    EXPECT_FALSE(instant_after(early, late));
    EXPECT_FALSE(instant_after(early, early));

    Timestamp nanos_later = early;
    nanos_later.nanos = 1;
    EXPECT_TRUE(instant_after(nanos_later, early));
}

TEST(Timestamp, BinaryLayoutIsBigEndian) {
    Timestamp t{};
    t.seconds = 1463090940;
    t.nanos = 5;
    t.offset_minutes = -420;

    std::array<u8, kTimestampBinaryBytes> buf{};
    ASSERT_EQ(timestamp_write_binary(t, {buf.data(), static_cast<u32>(buf.size())}), kTimestampBinaryBytes);

    // 1463090940 = 0x5734FEFC
    const std::array<u8, kTimestampBinaryBytes> want = {
        0x00, 0x00, 0x00, 0x00, 0x57, 0x34, 0xfe, 0xfc,
        0x00, 0x00, 0x00, 0x05,
        0xfe, 0x5c,
    };
    EXPECT_EQ(buf, want);

    Timestamp back{};
    ASSERT_TRUE(is_ok(timestamp_read_binary({buf.data(), static_cast<u32>(buf.size())}, &back)));
    EXPECT_EQ(back.seconds, t.seconds);
    EXPECT_EQ(back.nanos, t.nanos);
    EXPECT_EQ(back.offset_minutes, t.offset_minutes);
}

TEST(Timestamp, BinaryRejectsShortAndInvalid) {
    std::array<u8, kTimestampBinaryBytes> buf{};
    Timestamp out{};
    EXPECT_TRUE(is_length_error(timestamp_read_binary({buf.data(), kTimestampBinaryBytes - 1}, &out)));
    EXPECT_EQ(timestamp_write_binary(Timestamp{}, {buf.data(), kTimestampBinaryBytes - 1}), 0u);

    // nanos = 1e9
    buf[8] = 0x3b; buf[9] = 0x9a; buf[10] = 0xca; buf[11] = 0x00;
    EXPECT_TRUE(is_format_error(timestamp_read_binary({buf.data(), kTimestampBinaryBytes}, &out)));
}

TEST(Timestamp, ValidityBoundsLocalYear) {
    EXPECT_EQ(format(parse("0000-01-01T00:00:00Z")), "0000-01-01T00:00:00Z");
    EXPECT_EQ(format(parse("9999-12-31T23:59:59+01:00")), "9999-12-31T23:59:59+01:00");
    EXPECT_EQ(format(parse("0000-01-01T00:00:00-01:00")), "0000-01-01T00:00:00-01:00");

    Timestamp t{};
    t.seconds = kMinLocalSeconds;
    EXPECT_TRUE(timestamp_valid(t));
    t.offset_minutes = -1;
    EXPECT_FALSE(timestamp_valid(t));

    t = Timestamp{};
    t.seconds = kMaxLocalSeconds;
    EXPECT_TRUE(timestamp_valid(t));
    t.offset_minutes = 1;
    EXPECT_FALSE(timestamp_valid(t));

    t.seconds = INT64_MAX;
    t.offset_minutes = kMaxOffsetMinutes;
    EXPECT_FALSE(timestamp_valid(t));
    t.seconds = INT64_MIN;
    t.offset_minutes = -kMaxOffsetMinutes;
    EXPECT_FALSE(timestamp_valid(t));

    std::string out = "unchanged";
    EXPECT_TRUE(is_range_error(timestamp_to_text(t, &out)));
    EXPECT_EQ(out, "unchanged");
}

TEST(Timestamp, BinaryRejectsSecondsWithoutTextForm) {
    // seconds = INT64_MAX, nanos = 0, offset = +60
    const std::array<u8, kTimestampBinaryBytes> huge = {
        0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0x00, 0x00, 0x00, 0x00,
        0x00, 0x3c,
    };
    Timestamp out{};
    EXPECT_TRUE(is_format_error(timestamp_read_binary({huge.data(), kTimestampBinaryBytes}, &out)));
    EXPECT_TRUE(timestamp_is_zero(out));

    // seconds = INT64_MIN, offset = -60
    const std::array<u8, kTimestampBinaryBytes> tiny = {
        0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00,
        0xff, 0xc4,
    };
    EXPECT_TRUE(is_format_error(timestamp_read_binary({tiny.data(), kTimestampBinaryBytes}, &out)));

    // 9999-12-31T23:59:59Z itself decodes and formats.
    Timestamp last{};
    last.seconds = kMaxLocalSeconds;
    std::array<u8, kTimestampBinaryBytes> buf{};
    ASSERT_EQ(timestamp_write_binary(last, {buf.data(), kTimestampBinaryBytes}), kTimestampBinaryBytes);
    ASSERT_TRUE(is_ok(timestamp_read_binary({buf.data(), kTimestampBinaryBytes}, &out)));
    EXPECT_EQ(format(out), "9999-12-31T23:59:59Z");
}

TEST(Timestamp, NowIsRecent) {
    const Timestamp t = timestamp_now();
    EXPECT_GT(t.seconds, 1463090940);
    EXPECT_LT(t.nanos, kNanosPerSecond);
    EXPECT_EQ(t.offset_minutes, 0);
}

#include <cstring>

#include <gtest/gtest.h>

#include "faststatus/core/errors.hpp"
#include "faststatus/core/log.hpp"

using namespace faststatus::core;

TEST(Errors, MakeStatusCarriesDomainAndCode) {
    const Status s = make_status(StatusDomain::Codec, StatusCode::Format, 7);
    EXPECT_FALSE(is_ok(s));
    EXPECT_EQ(s.code, StatusCode::Format);
    EXPECT_EQ(s.domain, StatusDomain::Codec);
    EXPECT_EQ(s.field, StatusField::None);
    EXPECT_EQ(s.cause, StatusCode::Ok);
    EXPECT_EQ(s.aux, 7u);
}

TEST(Errors, WithFieldKeepsInnermostField) {
    Status s = make_status(StatusDomain::Codec, StatusCode::Range);
    s = with_field(s, StatusField::Occupancy);
    EXPECT_EQ(s.field, StatusField::Occupancy);

    s = with_field(s, StatusField::Record);
    EXPECT_EQ(s.field, StatusField::Occupancy);
}

TEST(Errors, WithFieldLeavesOkAlone) {
    const Status s = with_field(ok_status(), StatusField::Id);
    EXPECT_TRUE(is_ok(s));
    EXPECT_EQ(s.field, StatusField::None);
}

TEST(Errors, WrapKeepsRootCause) {
    const Status inner = with_field(make_status(StatusDomain::Codec, StatusCode::Format), StatusField::Since);
    const Status mid = wrap_status(StatusDomain::Store, StatusCode::Corrupt, inner);
    const Status outer = wrap_status(StatusDomain::External, StatusCode::Unknown, mid);

    EXPECT_EQ(mid.code, StatusCode::Corrupt);
    EXPECT_EQ(mid.cause, StatusCode::Format);
    EXPECT_EQ(mid.field, StatusField::Since);

    EXPECT_EQ(outer.code, StatusCode::Unknown);
    EXPECT_EQ(outer.domain, StatusDomain::External);
    EXPECT_EQ(outer.cause, StatusCode::Format);
    EXPECT_TRUE(is_format_error(outer));
    EXPECT_FALSE(is_conflict_error(outer));
}

TEST(Errors, DiscriminatorsSeeThroughWrapping) {
    const Status conflict = make_status(StatusDomain::Store, StatusCode::Conflict);
    EXPECT_TRUE(is_conflict_error(conflict));
    EXPECT_TRUE(is_conflict_error(wrap_status(StatusDomain::External, StatusCode::Unknown, conflict)));
    EXPECT_FALSE(is_zero_value_error(conflict));

    const Status zero = make_status(StatusDomain::Store, StatusCode::ZeroValue);
    EXPECT_TRUE(is_zero_value_error(zero));
    EXPECT_FALSE(is_conflict_error(zero));

    EXPECT_TRUE(is_length_error(make_status(StatusDomain::Codec, StatusCode::Length)));
    EXPECT_TRUE(is_range_error(make_status(StatusDomain::Codec, StatusCode::Range)));
}

TEST(Errors, OkIsNoKind) {
    EXPECT_FALSE(status_is(ok_status(), StatusCode::Ok));
    EXPECT_FALSE(is_conflict_error(ok_status()));
    EXPECT_FALSE(is_format_error(ok_status()));
}

TEST(Errors, Names) {
    EXPECT_STREQ(status_code_name(StatusCode::Conflict), "Conflict");
    EXPECT_STREQ(status_code_name(StatusCode::ZeroValue), "ZeroValue");
    EXPECT_STREQ(status_domain_name(StatusDomain::Store), "Store");
    EXPECT_STREQ(status_field_name(StatusField::FriendlyName), "friendlyName");
}

TEST(Log, LevelFromText) {
    LogLevel l = LogLevel::Off;
    EXPECT_TRUE(log_level_from_text("debug", &l));
    EXPECT_EQ(l, LogLevel::Debug);
    EXPECT_TRUE(log_level_from_text("ERROR", &l));
    EXPECT_EQ(l, LogLevel::Error);
    EXPECT_FALSE(log_level_from_text("loud", &l));
    EXPECT_FALSE(log_level_from_text(nullptr, &l));
}

TEST(Log, SetLevelGatesOutput) {
    const LogLevel saved = log_level();

    log_set_level(LogLevel::Error);
    EXPECT_FALSE(log_enabled(LogLevel::Warn));
    EXPECT_TRUE(log_enabled(LogLevel::Error));

    log_set_level(LogLevel::Off);
    EXPECT_FALSE(log_enabled(LogLevel::Error));
    log_status(LogLevel::Error, "silenced", make_status(StatusDomain::Db, StatusCode::Busy));

    log_set_level(saved);
}

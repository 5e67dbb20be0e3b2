#include <gtest/gtest.h>

#include "faststatus/core/errors.hpp"
#include "faststatus/resource/resource.hpp"

TEST(Status, DefaultIsOk){
    faststatus::core::Status s{};
    EXPECT_EQ(s.code, faststatus::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, faststatus::core::StatusDomain::Core);
    EXPECT_EQ(s.field, faststatus::core::StatusField::None);
    EXPECT_EQ(s.cause, faststatus::core::StatusCode::Ok);
    EXPECT_EQ(s.aux, 0u);
}

TEST(Resource, DefaultIsZeroValue){
    faststatus::resource::Resource r{};
    EXPECT_TRUE(faststatus::resource::id_is_zero(r.id));
    EXPECT_EQ(r.status, faststatus::core::Occupancy::Free);
    EXPECT_TRUE(faststatus::core::timestamp_is_zero(r.since));
    EXPECT_TRUE(r.friendly_name.empty());
    EXPECT_FALSE(faststatus::resource::resource_persistable(r));
}

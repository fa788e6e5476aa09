// =============================================================================
// FILE: tests/test_dialog_id_builder.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "sip/sip_dialog_id.h"

using namespace sip_subscription;

TEST(DialogIdBuilder, IsValidRejectsEmpty) {
    EXPECT_FALSE(DialogIdBuilder::is_valid(""));
}

TEST(DialogIdBuilder, IsValidRejectsTooLong) {
    std::string long_id(2000, 'x');
    EXPECT_FALSE(DialogIdBuilder::is_valid(long_id));
}

TEST(DialogIdBuilder, BuildIsHexDigest) {
    auto id = DialogIdBuilder::build("call-1@host", "ltag", "rtag");
    ASSERT_EQ(id.size(), 32u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_TRUE(DialogIdBuilder::is_valid(id));
}

TEST(DialogIdBuilder, BuildIsDeterministic) {
    EXPECT_EQ(DialogIdBuilder::build("c", "a", "b"), DialogIdBuilder::build("c", "a", "b"));
    EXPECT_NE(DialogIdBuilder::build("c", "a", "b"), DialogIdBuilder::build("c2", "a", "b"));
}

TEST(DialogIdBuilder, TagOrderMatters) {
    EXPECT_NE(DialogIdBuilder::build("c", "a", "b"), DialogIdBuilder::build("c", "b", "a"));
}

TEST(DialogIdBuilder, RemoteSwapsTags) {
    EXPECT_EQ(DialogIdBuilder::build_remote("c", "a", "b"), DialogIdBuilder::build("c", "b", "a"));
}

TEST(DialogIdBuilder, FieldsDoNotRunTogether) {
    EXPECT_NE(DialogIdBuilder::build("ab", "c", ""), DialogIdBuilder::build("a", "bc", ""));
}

TEST(DialogIdBuilder, BuildFromNullSipReturnsEmpty) {
    EXPECT_EQ(DialogIdBuilder::build(nullptr, true), "");
}

TEST(DialogIdBuilder, SanitizeDropsControlCharacters) {
    EXPECT_EQ(DialogIdBuilder::sanitize("ab\r\ncd;x=1"), "abcd;x=1");
    EXPECT_EQ(DialogIdBuilder::sanitize(nullptr), "");
    EXPECT_EQ(DialogIdBuilder::sanitize("abcdef", 3), "abc");
}

// =============================================================================
// FILE: tests/test_bson_tuple.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "common/base64.h"
#include "common/bson_tuple.h"

using namespace sip_subscription;

TEST(BsonTuple, DecodesWhatItEncodes) {
    std::vector<TupleField> in = {std::string("dialog"), std::nullopt, std::string("")};
    std::vector<TupleField> out;
    ASSERT_TRUE(BsonTuple::decode(BsonTuple::encode(in), out));
    EXPECT_EQ(out, in);
}

TEST(BsonTuple, EmptyTuple) {
    std::string raw = BsonTuple::encode({});
    EXPECT_EQ(raw.size(), 5u);
    std::vector<TupleField> out = {std::string("stale")};
    ASSERT_TRUE(BsonTuple::decode(raw, out));
    EXPECT_TRUE(out.empty());
}

TEST(BsonTuple, RejectsTruncatedDocument) {
    std::string raw = BsonTuple::encode({std::string("a"), std::string("b")});
    std::vector<TupleField> out;
    EXPECT_FALSE(BsonTuple::decode(raw.substr(0, raw.size() - 1), out));
    EXPECT_FALSE(BsonTuple::decode("", out));
}

TEST(BsonTuple, DigestIsLowercaseHex) {
    auto d = BsonTuple::digest({std::string("refer"), std::string("1")});
    ASSERT_EQ(d.size(), 32u);
    EXPECT_EQ(d.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(BsonTuple, NullDiffersFromEmptyString) {
    EXPECT_NE(BsonTuple::digest({std::string("dialog"), std::nullopt}),
              BsonTuple::digest({std::string("dialog"), std::string("")}));
}

TEST(Base64, EncodeKnownValues) {
    EXPECT_EQ(Base64::encode(""), "");
    EXPECT_EQ(Base64::encode("f"), "Zg==");
    EXPECT_EQ(Base64::encode("fo"), "Zm8=");
    EXPECT_EQ(Base64::encode("foo"), "Zm9v");
    EXPECT_EQ(Base64::encode("foobar"), "Zm9vYmFy");
}

TEST(Base64, DecodeKnownValues) {
    std::string out;
    ASSERT_TRUE(Base64::decode("Zm9vYmFy", out));
    EXPECT_EQ(out, "foobar");
    ASSERT_TRUE(Base64::decode("Zg==", out));
    EXPECT_EQ(out, "f");
}

TEST(Base64, DecodesBinary) {
    std::string bin("\x00\x01\xfe\xff", 4);
    std::string out;
    ASSERT_TRUE(Base64::decode(Base64::encode(bin), out));
    EXPECT_EQ(out, bin);
}

TEST(Base64, WellFormed) {
    EXPECT_TRUE(Base64::is_well_formed("Zm9v"));
    EXPECT_TRUE(Base64::is_well_formed("Zm8="));
    EXPECT_FALSE(Base64::is_well_formed("Zm9v-_"));
    EXPECT_FALSE(Base64::is_well_formed("Z"));
    EXPECT_FALSE(Base64::is_well_formed("Zg==="));
    EXPECT_FALSE(Base64::is_well_formed("Zm 9v"));
    EXPECT_FALSE(Base64::is_well_formed("Zg="));
}

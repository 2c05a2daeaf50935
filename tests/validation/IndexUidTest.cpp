#include "uuidres/IndexUid.hpp"
#include "uuidres/Result.hpp"
#include <gtest/gtest.h>
#include <set>
#include <string>

using namespace uuidres;

TEST(IndexUidTest, AcceptsAlphanumericDashUnderscore) {
    EXPECT_TRUE(isIndexUidValid("movies"));
    EXPECT_TRUE(isIndexUidValid("Movies_2024"));
    EXPECT_TRUE(isIndexUidValid("a-b_c-9"));
    EXPECT_TRUE(isIndexUidValid("_"));
    EXPECT_TRUE(isIndexUidValid("-"));
}

TEST(IndexUidTest, RejectsEmpty) {
    EXPECT_FALSE(isIndexUidValid(""));
}

TEST(IndexUidTest, RejectsOtherCharacters) {
    EXPECT_FALSE(isIndexUidValid("bad name!"));
    EXPECT_FALSE(isIndexUidValid("with space"));
    EXPECT_FALSE(isIndexUidValid("dot.ted"));
    EXPECT_FALSE(isIndexUidValid("slash/ed"));
    EXPECT_FALSE(isIndexUidValid("tab\t"));
    EXPECT_FALSE(isIndexUidValid(std::string("nul\0x", 5)));
}

TEST(IndexUidTest, RejectsNonAscii) {
    EXPECT_FALSE(isIndexUidValid("caf\xC3\xA9"));
}

TEST(UuidTest, NewUuidsAreVersion4AndDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        Uuid u = newUuidV4();
        EXPECT_EQ(u.version(), boost::uuids::uuid::version_random_number_based);
        EXPECT_EQ(u.variant(), boost::uuids::uuid::variant_rfc_4122);
        seen.insert(toString(u));
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(UuidTest, BytesRoundTripExactly) {
    Uuid u = newUuidV4();
    auto back = uuidFromBytes(u.begin(), u.size());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, u);
}

TEST(UuidTest, WrongByteCountIsRejected) {
    unsigned char buf[17] = {};
    EXPECT_FALSE(uuidFromBytes(buf, 15).has_value());
    EXPECT_FALSE(uuidFromBytes(buf, 17).has_value());
    EXPECT_FALSE(uuidFromBytes(nullptr, 16).has_value());
}

TEST(UuidTest, ParseHyphenatedText) {
    auto u = parseUuid("0e4f8a2c-5b7d-4c3a-9f1e-2d6b8a0c4e71");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(toString(*u), "0e4f8a2c-5b7d-4c3a-9f1e-2d6b8a0c4e71");
    EXPECT_FALSE(parseUuid("not-a-uuid").has_value());
    EXPECT_FALSE(parseUuid("").has_value());
}

TEST(ErrorTest, DescribeNamesTheCode) {
    EXPECT_EQ(badlyFormatted("a b").code, ErrorCode::BadlyFormatted);
    EXPECT_EQ(unexistingIndex("x").describe(), "unexisting_index: Index \"x\" doesn't exist.");
    EXPECT_STREQ(errorCodeName(ErrorCode::NameAlreadyExists), "name_already_exists");
}

TEST(ResultTest, VoidResultStates) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());
    Result<void> bad(unexistingIndex("x"));
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::UnexistingIndex);
}

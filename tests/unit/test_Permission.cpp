#include <gtest/gtest.h>
#include "types/Permission.hpp"
#include "config/ConfigError.hpp"

#include <nlohmann/json.hpp>

using namespace ferry::types;
using ferry::config::ConfigError;
using ferry::config::ConfigErrorKind;

TEST(PermissionTest, ParsesSubset) {
    const auto set = parsePermissions("elr");
    EXPECT_TRUE(allows(set, PermissionFlag::EnterDirectory));
    EXPECT_TRUE(allows(set, PermissionFlag::List));
    EXPECT_TRUE(allows(set, PermissionFlag::Read));
    EXPECT_FALSE(allows(set, PermissionFlag::Write));
    EXPECT_FALSE(allows(set, PermissionFlag::Delete));
    EXPECT_EQ(flagsOf(set).size(), 3u);
}

TEST(PermissionTest, AllLettersIsFull) {
    EXPECT_EQ(parsePermissions("elradfmw"), PermissionSet::full());
    EXPECT_EQ(parsePermissions("wmfdarle"), PermissionSet::full());
}

TEST(PermissionTest, EmptyStringGrantsNothing) {
    const auto set = parsePermissions("");
    EXPECT_TRUE(set.empty());
    EXPECT_EQ(set, PermissionSet::none());
}

TEST(PermissionTest, RepeatedLettersAreIdempotent) {
    EXPECT_EQ(parsePermissions("rrr"), parsePermissions("r"));
}

TEST(PermissionTest, RejectsUnknownLetter) {
    try {
        (void)parsePermissions("elrx");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.kind(), ConfigErrorKind::InvalidPermissionCharacter);
        EXPECT_EQ(e.detail(), "x");
    }
}

TEST(PermissionTest, LettersAreCaseSensitive) {
    EXPECT_THROW((void)parsePermissions("R"), ConfigError);
}

TEST(PermissionTest, CanonicalStringOrder) {
    EXPECT_EQ(to_string(parsePermissions("wre")), "erw");
    EXPECT_EQ(to_string(PermissionSet::full()), "elradfmw");
    EXPECT_EQ(to_string(PermissionSet::none()), "");
}

TEST(PermissionTest, FlagNames) {
    EXPECT_EQ(toLetter(PermissionFlag::Rename), 'f');
    EXPECT_EQ(to_string(PermissionFlag::MakeDirectory), "make-directory");
}

TEST(PermissionTest, JsonListsEveryFlag) {
    const nlohmann::json j = parsePermissions("lr");
    ASSERT_EQ(j.size(), 8u);
    EXPECT_TRUE(j.at("list").get<bool>());
    EXPECT_TRUE(j.at("read").get<bool>());
    EXPECT_FALSE(j.at("write").get<bool>());
}

TEST(PermissionTest, EveryMaskSurvivesCanonicalEncoding) {
    for (unsigned int mask = 0; mask <= PermissionSet::FULL_MASK; ++mask) {
        const PermissionSet set{static_cast<uint8_t>(mask)};
        const auto letters = to_string(set);

        EXPECT_EQ(parsePermissions(letters), set) << "mask " << mask;
        EXPECT_EQ(to_string(parsePermissions(letters)), letters) << "mask " << mask;
        EXPECT_EQ(letters.size(), flagsOf(set).size());
    }
}

#include <metatree/digest.h>
#include <metatree/sharding.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace metatree {
namespace {

TEST(DigestTest, MatchesKnownSha1Values) {
  EXPECT_EQ(Sha1Hex(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
  EXPECT_EQ(Sha1Hex("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(DigestTest, DependsOnEveryByte) {
  EXPECT_NE(Sha1Hex("{\"a\":1}"), Sha1Hex("{\"a\":2}"));
  EXPECT_EQ(Sha1Hex(std::string("a\0b", 3)).size(), 40u);
  EXPECT_NE(Sha1Hex(std::string("a\0b", 3)), Sha1Hex("a"));
}

TEST(ShardingTest, SplitsLeadingPrefixes) {
  const auto split = SplitName("abcdef", {2, 2});
  EXPECT_EQ(split.directory, std::filesystem::path("ab") / "cd");
  EXPECT_EQ(split.remainder, "ef");
  EXPECT_EQ(ShardedPath("abcdefgh", {2, 2, 2}),
            std::filesystem::path("ab") / "cd" / "ef" / "gh");
}

TEST(ShardingTest, RejectsNamesWithoutRemainder) {
  EXPECT_THROW(SplitName("abcd", {2, 2}), std::invalid_argument);
}

TEST(ShardingTest, KeepsPlainTokensAndHashesOthers) {
  EXPECT_EQ(ShardKey("1.0-release", {2, 2}), "1.0-release");

  const auto slashed = ShardKey("v1/x", {2, 2});
  EXPECT_EQ(slashed, "~" + Sha1Hex("v1/x"));
  EXPECT_EQ(ShardKey("abc", {2, 2}), "~" + Sha1Hex("abc"));
  EXPECT_EQ(ShardKey("..hidden", {2, 2}), "~" + Sha1Hex("..hidden"));
  EXPECT_NE(ShardKey("v1/x", {2, 2}), ShardKey("v1_x", {2, 2}));
}

} // namespace
} // namespace metatree

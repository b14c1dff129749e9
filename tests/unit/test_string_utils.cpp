#include <gtest/gtest.h>
#include "sandexec/utils/string_utils.hpp"

#include <stdexcept>
#include <string>

using sandexec::utils::StringUtils;

// ============================================================================
// String Manipulation Tests
// ============================================================================

TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(StringUtils::Trim("  hello \n\t"), "hello");
    EXPECT_EQ(StringUtils::Trim("inner  space"), "inner  space");
    EXPECT_EQ(StringUtils::Trim("   "), "");
    EXPECT_EQ(StringUtils::Trim(""), "");
}

TEST(StringUtilsTest, SplitSkipsEmptyTokens) {
    auto parts = StringUtils::Split("size=16m,,noexec,nosuid,", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "size=16m");
    EXPECT_EQ(parts[1], "noexec");
    EXPECT_EQ(parts[2], "nosuid");
}

TEST(StringUtilsTest, JoinInsertsDelimiterBetweenElements) {
    EXPECT_EQ(StringUtils::Join({"a", "b", "c"}, "; "), "a; b; c");
    EXPECT_EQ(StringUtils::Join({"only"}, ","), "only");
    EXPECT_EQ(StringUtils::Join({}, ","), "");
}

TEST(StringUtilsTest, ToLowerIsAsciiOnly) {
    EXPECT_EQ(StringUtils::ToLower("DEBUG"), "debug");
    EXPECT_EQ(StringUtils::ToLower("Warn"), "warn");
}

TEST(StringUtilsTest, PrefixSuffixAndContains) {
    EXPECT_TRUE(StringUtils::StartsWith("echo 'abc'", "echo '"));
    EXPECT_FALSE(StringUtils::StartsWith("ec", "echo"));
    EXPECT_TRUE(StringUtils::EndsWith("python3", "3"));
    EXPECT_TRUE(StringUtils::Contains("a | base64 -d | b", "base64 -d"));
}

TEST(StringUtilsTest, TruncateAppendsSuffixOnlyWhenShortened) {
    EXPECT_EQ(StringUtils::Truncate("abcdef", 3), "abc...");
    EXPECT_EQ(StringUtils::Truncate("abc", 3), "abc");
    EXPECT_EQ(StringUtils::Truncate("abcdef", 2, ""), "ab");
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST(StringUtilsTest, ToBase64MatchesRfc4648Vectors) {
    EXPECT_EQ(StringUtils::ToBase64(""), "");
    EXPECT_EQ(StringUtils::ToBase64("f"), "Zg==");
    EXPECT_EQ(StringUtils::ToBase64("fo"), "Zm8=");
    EXPECT_EQ(StringUtils::ToBase64("foo"), "Zm9v");
    EXPECT_EQ(StringUtils::ToBase64("foob"), "Zm9vYg==");
    EXPECT_EQ(StringUtils::ToBase64("fooba"), "Zm9vYmE=");
    EXPECT_EQ(StringUtils::ToBase64("foobar"), "Zm9vYmFy");
}

TEST(StringUtilsTest, ToBase64HandlesBinaryBytes) {
    std::string binary("\x00\xff\x10\x80", 4);
    EXPECT_EQ(StringUtils::ToBase64(binary), "AP8QgA==");
    EXPECT_EQ(StringUtils::FromBase64("AP8QgA=="), binary);
}

TEST(StringUtilsTest, FromBase64RejectsForeignCharacters) {
    EXPECT_THROW(StringUtils::FromBase64("Zm9v$"), std::invalid_argument);
    EXPECT_THROW(StringUtils::FromBase64("Zm 9v"), std::invalid_argument);
}

TEST(StringUtilsTest, IsBase64AcceptsOnlyAlphabetAndPadding) {
    EXPECT_TRUE(StringUtils::IsBase64("Zm9vYg=="));
    EXPECT_TRUE(StringUtils::IsBase64("a+b/"));
    EXPECT_FALSE(StringUtils::IsBase64("it's"));
    EXPECT_FALSE(StringUtils::IsBase64("a b"));
}

TEST(StringUtilsTest, UrlEncodeKeepsUnreservedCharacters) {
    EXPECT_EQ(StringUtils::UrlEncode("python"), "python");
    EXPECT_EQ(StringUtils::UrlEncode("3.12-slim_x~"), "3.12-slim_x~");
    EXPECT_EQ(StringUtils::UrlEncode("library/node:20"), "library%2Fnode%3A20");
    EXPECT_EQ(StringUtils::UrlEncode("a b"), "a%20b");
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

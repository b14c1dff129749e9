#include <gtest/gtest.h>
#include "sandexec/core/command_builder.hpp"
#include "sandexec/core/errors.hpp"
#include "sandexec/utils/string_utils.hpp"

#include <string>
#include <vector>

using namespace sandexec::core;
using sandexec::utils::StringUtils;

namespace {

std::string DecodedPayload(const std::vector<std::string>& argv) {
    auto payload = CommandBuilder::ExtractPayload(argv);
    EXPECT_TRUE(payload.has_value());
    return payload ? StringUtils::FromBase64(*payload) : std::string();
}

} // anonymous namespace

// ============================================================================
// Build Tests
// ============================================================================

TEST(CommandBuilderTest, BuildsShellPipeline) {
    CommandBuilder builder;
    auto argv = builder.Build("python", "print('hi')");

    ASSERT_EQ(argv.size(), 3u);
    EXPECT_EQ(argv[0], "sh");
    EXPECT_EQ(argv[1], "-c");
    EXPECT_EQ(argv[2], "echo 'cHJpbnQoJ2hpJyk=' | base64 -d | python3");
}

TEST(CommandBuilderTest, InterpreterFollowsLanguage) {
    CommandBuilder builder;

    EXPECT_TRUE(StringUtils::EndsWith(builder.Build("bash", "echo hi")[2], "| sh"));
    EXPECT_TRUE(StringUtils::EndsWith(builder.Build("javascript", "1")[2], "| node"));
}

TEST(CommandBuilderTest, SourceWithQuotesAndNewlinesSurvives) {
    CommandBuilder builder;
    const std::string source = "x = \"it's\"\nprint(x)\n$(rm -rf /) `id` \\n\n";

    auto argv = builder.Build("python", source);

    EXPECT_EQ(argv[2].find('\n'), std::string::npos);
    EXPECT_EQ(argv[2].find("it's"), std::string::npos);
    EXPECT_EQ(DecodedPayload(argv), source);
}

TEST(CommandBuilderTest, NonAsciiSourceSurvives) {
    CommandBuilder builder;
    const std::string source = "print(\"h\xC3\xA9llo \xE2\x9C\x93\")";

    EXPECT_EQ(DecodedPayload(builder.Build("python", source)), source);
}

TEST(CommandBuilderTest, UnsupportedLanguageThrows) {
    CommandBuilder builder;
    EXPECT_THROW(builder.Build("cobol", "DISPLAY 'HI'."), InputError);
}

TEST(CommandBuilderTest, UsesSuppliedCatalog) {
    LanguageCatalog catalog({{"ruby", "ruby:3.3-alpine", "ruby"}});
    CommandBuilder builder(catalog);

    EXPECT_TRUE(StringUtils::EndsWith(builder.Build("ruby", "puts 1")[2], "| ruby"));
    EXPECT_THROW(builder.Build("python", "print(1)"), InputError);
}

// ============================================================================
// ExtractPayload Tests
// ============================================================================

TEST(CommandBuilderTest, ExtractPayloadRejectsForeignCommands) {
    EXPECT_FALSE(CommandBuilder::ExtractPayload({"python3", "-c", "print(1)"}).has_value());
    EXPECT_FALSE(CommandBuilder::ExtractPayload({"sh", "-c"}).has_value());
    EXPECT_FALSE(CommandBuilder::ExtractPayload({"sh", "-c", "echo 'abc'"}).has_value());
    EXPECT_FALSE(CommandBuilder::ExtractPayload({"sh", "-c", "echo 'a b' | base64 -d | sh"}).has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

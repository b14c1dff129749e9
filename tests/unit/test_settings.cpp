#include <gtest/gtest.h>
#include "sandexec/config/settings.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using sandexec::config::Settings;
using json = nlohmann::json;

namespace {

bool HasProblem(const std::vector<std::string>& problems, const std::string& needle) {
    return std::any_of(problems.begin(), problems.end(), [&](const std::string& p) {
        return p.find(needle) != std::string::npos;
    });
}

class SettingsFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("sandexec_settings_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void Write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    std::filesystem::path path_;
};

} // anonymous namespace

// ============================================================================
// Defaults Tests
// ============================================================================

TEST(SettingsTest, DefaultsAreValid) {
    Settings settings;

    EXPECT_TRUE(settings.Validate().empty());
    EXPECT_EQ(settings.default_timeout_seconds, 10);
    EXPECT_EQ(settings.max_timeout_seconds, 30);
    EXPECT_EQ(settings.docker_socket, "/var/run/docker.sock");
}

TEST(SettingsTest, ExecutorConfigConversion) {
    Settings settings;
    settings.memory_limit_mb = 128;
    settings.cpu_limit = 1.5;
    settings.tmpfs_size_mb = 8;

    auto config = settings.ToExecutorConfig();

    EXPECT_EQ(config.limits.memory_limit_bytes, 128LL * 1024 * 1024);
    EXPECT_EQ(config.limits.cpu_nanos, 1500000000);
    EXPECT_EQ(config.limits.pids_limit, 64);
    EXPECT_EQ(config.limits.tmpfs_size_bytes, 8LL * 1024 * 1024);
    EXPECT_EQ(config.default_timeout, std::chrono::seconds(10));
    EXPECT_EQ(config.cleanup_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.max_code_bytes, 64u * 1024);
}

// ============================================================================
// FromJson Tests
// ============================================================================

TEST(SettingsTest, FromJsonOverridesKnownKeys) {
    auto settings = Settings::FromJson(json{
        {"default_timeout_seconds", 5},
        {"cpu_limit", 1},
        {"docker_socket", "/run/user/1000/docker.sock"},
        {"api_version", "v1.43"},
    });

    EXPECT_EQ(settings.default_timeout_seconds, 5);
    EXPECT_DOUBLE_EQ(settings.cpu_limit, 1.0);
    EXPECT_EQ(settings.docker_socket, "/run/user/1000/docker.sock");
    EXPECT_EQ(settings.api_version, "v1.43");
    EXPECT_EQ(settings.max_timeout_seconds, 30);
}

TEST(SettingsTest, FromJsonRejectsUnknownKey) {
    try {
        Settings::FromJson(json{{"network_mode", "bridge"}});
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "settings: unknown key 'network_mode'");
    }
}

TEST(SettingsTest, FromJsonRejectsWrongTypes) {
    EXPECT_THROW(Settings::FromJson(json{{"pids_limit", "64"}}), std::invalid_argument);
    EXPECT_THROW(Settings::FromJson(json{{"default_timeout_seconds", 2.5}}), std::invalid_argument);
    EXPECT_THROW(Settings::FromJson(json{{"cpu_limit", "half"}}), std::invalid_argument);
    EXPECT_THROW(Settings::FromJson(json{{"log_level", 3}}), std::invalid_argument);
    EXPECT_THROW(Settings::FromJson(json::array()), std::invalid_argument);
}

TEST(SettingsTest, ToJsonRoundTripsThroughFromJson) {
    Settings original;
    original.memory_limit_mb = 256;
    original.api_version = "v1.45";

    auto restored = Settings::FromJson(original.ToJson());

    EXPECT_EQ(restored.memory_limit_mb, 256);
    EXPECT_EQ(restored.api_version, "v1.45");
    EXPECT_FALSE(Settings().ToJson().contains("api_version"));
}

// ============================================================================
// Validate Tests
// ============================================================================

TEST(SettingsTest, ValidateReportsEveryProblem) {
    Settings settings;
    settings.default_timeout_seconds = 60;
    settings.memory_limit_mb = 4;
    settings.cpu_limit = 0.0;
    settings.pids_limit = 0;
    settings.max_code_bytes = 200 * 1024;
    settings.docker_socket.clear();
    settings.log_level = "verbose";

    auto problems = settings.Validate();

    EXPECT_TRUE(HasProblem(problems, "default_timeout_seconds"));
    EXPECT_TRUE(HasProblem(problems, "memory_limit_mb"));
    EXPECT_TRUE(HasProblem(problems, "cpu_limit"));
    EXPECT_TRUE(HasProblem(problems, "pids_limit"));
    EXPECT_TRUE(HasProblem(problems, "max_code_bytes"));
    EXPECT_TRUE(HasProblem(problems, "docker_socket"));
    EXPECT_TRUE(HasProblem(problems, "'verbose'"));
    EXPECT_EQ(problems.size(), 7u);
}

// ============================================================================
// File Loading Tests
// ============================================================================

TEST_F(SettingsFileTest, LoadsFile) {
    Write(R"({"max_timeout_seconds": 60, "log_level": "debug"})");

    auto settings = Settings::LoadFromFile(path_);

    EXPECT_EQ(settings.max_timeout_seconds, 60);
    EXPECT_EQ(settings.log_level, "debug");
}

TEST_F(SettingsFileTest, MissingFileThrows) {
    EXPECT_THROW(Settings::LoadFromFile(path_), std::runtime_error);
}

TEST_F(SettingsFileTest, InvalidJsonThrows) {
    Write("{ max_timeout_seconds: 60 ");

    try {
        Settings::LoadFromFile(path_);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Invalid settings file"), std::string::npos);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#include <gtest/gtest.h>
#include "audience/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace audience;
namespace fs = std::filesystem;

TEST(ConfigTest, Defaults) {
    AudienceConfig config = AudienceConfig::parse("");
    EXPECT_EQ(config.privacy_status, PrivacyStatus::Unknown);
    EXPECT_TRUE(config.storage_dir.empty());
    EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST(ConfigTest, ParsesAllFields) {
    AudienceConfig config = AudienceConfig::parse(
        "audience:\n"
        "  privacy_status: optedin\n"
        "  storage_dir: /var/lib/audience\n"
        "log:\n"
        "  level: debug\n");

    EXPECT_EQ(config.privacy_status, PrivacyStatus::OptedIn);
    EXPECT_EQ(config.storage_dir, fs::path{"/var/lib/audience"});
    EXPECT_EQ(config.log_level, LogLevel::Debug);
}

TEST(ConfigTest, InvalidValuesThrow) {
    EXPECT_THROW(AudienceConfig::parse("audience:\n  privacy_status: sometimes\n"), ConfigError);
    EXPECT_THROW(AudienceConfig::parse("log:\n  level: loud\n"), ConfigError);
    EXPECT_THROW(AudienceConfig::parse("- just\n- a list\n"), ConfigError);
    EXPECT_THROW(AudienceConfig::parse("audience: [broken\n"), ConfigError);
}

TEST(ConfigTest, MissingFileGivesDefaults) {
    testing::internal::CaptureStderr();
    AudienceConfig config = AudienceConfig::load("/nonexistent/audience.yaml");
    std::string logged = testing::internal::GetCapturedStderr();

    EXPECT_NE(logged.find("WARN [AudienceConfig] load - /nonexistent/audience.yaml not found"), std::string::npos);
    EXPECT_EQ(config.privacy_status, PrivacyStatus::Unknown);
    EXPECT_TRUE(config.storage_dir.empty());
}

TEST(ConfigTest, RelativeStorageDirFollowsConfigFile) {
    fs::path dir = fs::temp_directory_path() / ("audience_config_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "audience.yaml");
        out << "audience:\n  storage_dir: data\n  privacy_status: optedout\n";
    }

    AudienceConfig config = AudienceConfig::load(dir / "audience.yaml");
    EXPECT_EQ(config.storage_dir, (fs::absolute(dir) / "data").lexically_normal());
    EXPECT_EQ(config.privacy_status, PrivacyStatus::OptedOut);

    fs::remove_all(dir);
}

TEST(ConfigTest, ResolvePathPrefersArgument) {
    EXPECT_EQ(AudienceConfig::resolve_path("custom.yaml"), fs::path{"custom.yaml"});

    ::setenv("AUDIENCE_CONFIG_PATH", "/etc/audience.yaml", 1);
    EXPECT_EQ(AudienceConfig::resolve_path(nullptr), fs::path{"/etc/audience.yaml"});

    ::unsetenv("AUDIENCE_CONFIG_PATH");
    EXPECT_EQ(AudienceConfig::resolve_path(nullptr), fs::path{"config/audience.yaml"});
}

TEST(LogLevelTest, ParseLevels) {
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("3"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("nonsense", LogLevel::Error), LogLevel::Error);
}

TEST(LogLevelTest, TryParseRejectsUnknownText) {
    EXPECT_EQ(try_parse_log_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(try_parse_log_level("2"), LogLevel::Info);
    EXPECT_FALSE(try_parse_log_level("loud").has_value());
    EXPECT_FALSE(try_parse_log_level("").has_value());
}

TEST(LogLevelTest, FiltersBelowLevel) {
    Logger& logger = Logger::instance();
    LogLevel previous = logger.level();
    logger.set_level(LogLevel::Warn);

    testing::internal::CaptureStderr();
    log::info("Test", "hidden");
    log::error("Test", "shown");
    std::string output = testing::internal::GetCapturedStderr();

    logger.set_level(previous);
    EXPECT_EQ(output, "ERROR [Test] shown\n");
}

#include <gtest/gtest.h>
#include "config.h"
#include "logger.h"
#include "system_prompt.h"
#include "test_helpers.h"
#include "temp_dir.h"
#include <memory>

using test_helpers::ScopedEnv;
using test_helpers::write_file;

// Test fixture for Config tests
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test configs
        temp_dir = std::make_unique<test_helpers::TempDir>("config_test_");
        ASSERT_TRUE(temp_dir->valid());
        xdg = std::make_unique<ScopedEnv>("XDG_CONFIG_HOME", temp_dir->path());
    }

    void TearDown() override {
        xdg.reset();
        temp_dir.reset();
    }

    std::string default_config_file() const {
        return temp_dir->path() + "/modelgate/config.json";
    }

    std::unique_ptr<test_helpers::TempDir> temp_dir;
    std::unique_ptr<ScopedEnv> xdg;
};

// =============================================================================
// Defaults and paths
// =============================================================================

TEST_F(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.system_prompt, SYSTEM_PROMPT);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.log_file, "");
    EXPECT_EQ(cfg.model, "");
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, DefaultPathUsesXdgConfigHome) {
    EXPECT_EQ(Config::get_default_config_path(), default_config_file());
}

TEST_F(ConfigTest, DefaultPathFallsBackToHome) {
    ScopedEnv no_xdg("XDG_CONFIG_HOME", "");
    ScopedEnv home("HOME", temp_dir->path());

    EXPECT_EQ(Config::get_default_config_path(), temp_dir->path() + "/.config/modelgate/config.json");
}

TEST_F(ConfigTest, CustomPathOverridesDefault) {
    Config cfg;
    cfg.set_config_path("/etc/modelgate.json");
    EXPECT_EQ(cfg.get_config_path(), "/etc/modelgate.json");
}

// =============================================================================
// Loading
// =============================================================================

TEST_F(ConfigTest, MissingDefaultFileKeepsDefaults) {
    Config cfg;
    EXPECT_NO_THROW(cfg.load());
    EXPECT_EQ(cfg.system_prompt, SYSTEM_PROMPT);
}

TEST_F(ConfigTest, MissingCustomFileThrows) {
    Config cfg;
    cfg.set_config_path(temp_dir->file_path("nope.json"));
    EXPECT_THROW(cfg.load(), ConfigError);
}

TEST_F(ConfigTest, LoadsValuesFromDefaultFile) {
    ASSERT_TRUE(write_file(default_config_file(), R"({
        "system_prompt": "You are terse.",
        "log_level": "debug",
        "log_file": "/tmp/modelgate.log",
        "model": "Qwen/Qwen2-VL-7B"
    })"));

    Config cfg;
    cfg.load();

    EXPECT_EQ(cfg.system_prompt, "You are terse.");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.log_file, "/tmp/modelgate.log");
    EXPECT_EQ(cfg.model, "Qwen/Qwen2-VL-7B");
    EXPECT_EQ(cfg.json["model"], "Qwen/Qwen2-VL-7B");
}

TEST_F(ConfigTest, PartialFileKeepsOtherDefaults) {
    std::string path = temp_dir->file_path("partial.json");
    ASSERT_TRUE(write_file(path, R"({"model": "google/gemma-2b-it"})"));

    Config cfg;
    cfg.set_config_path(path);
    cfg.load();

    EXPECT_EQ(cfg.model, "google/gemma-2b-it");
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.system_prompt, SYSTEM_PROMPT);
}

TEST_F(ConfigTest, InvalidJsonThrows) {
    ASSERT_TRUE(write_file(default_config_file(), "{ not json"));
    Config cfg;
    EXPECT_THROW(cfg.load(), ConfigError);
}

TEST_F(ConfigTest, NonObjectThrows) {
    ASSERT_TRUE(write_file(default_config_file(), "[1, 2, 3]"));
    Config cfg;
    EXPECT_THROW(cfg.load(), ConfigError);
}

TEST_F(ConfigTest, WrongValueTypeThrows) {
    ASSERT_TRUE(write_file(default_config_file(), R"({"log_level": 3})"));
    Config cfg;
    EXPECT_THROW(cfg.load(), ConfigError);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ConfigTest, ValidateRejectsUnknownLogLevel) {
    Config cfg;
    cfg.log_level = "verbose";
    EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST_F(ConfigTest, ValidateAcceptsAnyCase) {
    Config cfg;
    cfg.log_level = "WARNING";
    EXPECT_NO_THROW(cfg.validate());
}

TEST(LoggerTest, ParseLevel) {
    LogLevel level = LogLevel::INFO;

    EXPECT_TRUE(Logger::parse_level("trace", level));
    EXPECT_EQ(level, LogLevel::TRACE);
    EXPECT_TRUE(Logger::parse_level("Debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parse_level("warn", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parse_level("fatal", level));
    EXPECT_EQ(level, LogLevel::FATAL);

    EXPECT_FALSE(Logger::parse_level("loud", level));
    EXPECT_EQ(level, LogLevel::FATAL) << "Level is untouched on failure";
}

#include <gtest/gtest.h>
#include "app/AppConfig.hpp"
#include "app/Logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace {

std::string writeTemp(const std::string& name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream f(path);
    f << contents;
    return path;
}

}

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        unsetenv("TEACUP_ENV");
        unsetenv("APP_ENV");
        unsetenv("TEACUP_LOG_LEVEL");
        unsetenv("TEACUP_FPS");
        unsetenv("TEACUP_DOTENV_A");
        unsetenv("TEACUP_DOTENV_B");
    }
};

TEST_F(AppConfigTest, Defaults) {
    AppConfig c;
    EXPECT_EQ(c.env, "production");
    EXPECT_EQ(c.fps, 60);
    EXPECT_EQ(c.logLevel, "info");
    EXPECT_TRUE(c.rootState.is_object());
    EXPECT_FALSE(c.headless);
    EXPECT_FALSE(c.hotReloadingEnabled());
    EXPECT_EQ(c.refreshInterval(), std::chrono::milliseconds(16));
}

TEST_F(AppConfigTest, FromJson) {
    auto c = AppConfig::fromJson({
        {"env", "development"},
        {"root", "Dashboard"},
        {"root_state", {{"title", "T"}}},
        {"fps", 30},
        {"log_level", "debug"},
        {"log_file", "x.log"},
        {"headless", true},
    });

    EXPECT_EQ(c.env, "development");
    EXPECT_EQ(c.root, "Dashboard");
    EXPECT_EQ(c.rootState["title"], "T");
    EXPECT_EQ(c.fps, 30);
    EXPECT_EQ(c.logLevel, "debug");
    EXPECT_EQ(c.logFile, "x.log");
    EXPECT_TRUE(c.headless);
    EXPECT_EQ(c.refreshInterval(), std::chrono::milliseconds(33));
}

TEST_F(AppConfigTest, RefreshIntervalClampedAtHighFps) {
    AppConfig c;
    c.fps = 2000;
    EXPECT_EQ(c.refreshInterval(), std::chrono::milliseconds(1));
}

TEST_F(AppConfigTest, RejectsBadValues) {
    EXPECT_THROW(AppConfig::fromJson(nlohmann::json::array()), ConfigError);
    EXPECT_THROW(AppConfig::fromJson({{"fps", 0}}), ConfigError);
    EXPECT_THROW(AppConfig::fromJson({{"fps", -5}}), ConfigError);
    EXPECT_THROW(AppConfig::fromJson({{"fps", "fast"}}), ConfigError);
    EXPECT_THROW(AppConfig::fromJson({{"root_state", 3}}), ConfigError);
    EXPECT_THROW(AppConfig::fromJson({{"hot_reloading", "yes"}}), ConfigError);
}

TEST_F(AppConfigTest, HotReloadingFollowsEnvUnlessSet) {
    AppConfig c;
    c.env = "development";
    EXPECT_TRUE(c.hotReloadingEnabled());

    c.hotReloading = false;
    EXPECT_FALSE(c.hotReloadingEnabled());

    c.env = "production";
    c.hotReloading = true;
    EXPECT_TRUE(c.hotReloadingEnabled());

    auto parsed = AppConfig::fromJson({{"env", "development"},
                                       {"hot_reloading", false}});
    EXPECT_FALSE(parsed.hotReloadingEnabled());
}

TEST_F(AppConfigTest, LoadFromFile) {
    auto path = writeTemp("teacup_config.json",
                          R"({"root": "Main", "fps": 20})");
    auto c = AppConfig::load(path);
    EXPECT_EQ(c.root, "Main");
    EXPECT_EQ(c.fps, 20);
    std::remove(path.c_str());
}

TEST_F(AppConfigTest, MissingFileThrows) {
    EXPECT_THROW(AppConfig::load("/nonexistent/teacup.json"), ConfigError);
}

TEST_F(AppConfigTest, InvalidJsonThrows) {
    auto path = writeTemp("teacup_broken.json", "{not json");
    EXPECT_THROW(AppConfig::load(path), ConfigError);
    std::remove(path.c_str());
}

TEST_F(AppConfigTest, EnvironmentOverrides) {
    setenv("APP_ENV", "staging", 1);
    setenv("TEACUP_LOG_LEVEL", "warn", 1);
    setenv("TEACUP_FPS", "10", 1);

    AppConfig c;
    c.applyEnvironment();
    EXPECT_EQ(c.env, "staging");
    EXPECT_EQ(c.logLevel, "warn");
    EXPECT_EQ(c.fps, 10);

    setenv("TEACUP_ENV", "development", 1);
    c.applyEnvironment();
    EXPECT_EQ(c.env, "development");
    EXPECT_TRUE(c.hotReloadingEnabled());
}

TEST_F(AppConfigTest, BadFpsEnvironmentThrows) {
    setenv("TEACUP_FPS", "zero", 1);
    AppConfig c;
    EXPECT_THROW(c.applyEnvironment(), ConfigError);

    setenv("TEACUP_FPS", "-1", 1);
    EXPECT_THROW(c.applyEnvironment(), ConfigError);
}

TEST_F(AppConfigTest, DotEnvDoesNotOverride) {
    setenv("TEACUP_DOTENV_A", "kept", 1);
    auto path = writeTemp("teacup.env",
                          "# comment\n"
                          "TEACUP_DOTENV_A=replaced\n"
                          "TEACUP_DOTENV_B=\"quoted value\"\n"
                          "garbage line\n");
    EXPECT_EQ(loadDotEnv(path), 1);

    EXPECT_EQ(getEnv("TEACUP_DOTENV_A"), "kept");
    EXPECT_EQ(getEnv("TEACUP_DOTENV_B"), "quoted value");
    EXPECT_EQ(getEnv("TEACUP_UNSET_VARIABLE", "fallback"), "fallback");
    std::remove(path.c_str());
}

TEST_F(AppConfigTest, MissingDotEnvIsIgnored) {
    EXPECT_EQ(loadDotEnv("/nonexistent/.env"), 0);
}

using EnvEntry = std::pair<std::string, std::string>;

TEST(DotEnvLineTest, PlainAndExported) {
    EXPECT_EQ(parseDotEnvLine("KEY=value"), (EnvEntry{"KEY", "value"}));
    EXPECT_EQ(parseDotEnvLine("  export KEY = value  "), (EnvEntry{"KEY", "value"}));
}

TEST(DotEnvLineTest, Quotes) {
    EXPECT_EQ(parseDotEnvLine("A=\"two words\""), (EnvEntry{"A", "two words"}));
    EXPECT_EQ(parseDotEnvLine("A='# not a comment'"),
              (EnvEntry{"A", "# not a comment"}));
}

TEST(DotEnvLineTest, TrailingCommentOnUnquotedValue) {
    EXPECT_EQ(parseDotEnvLine("LEVEL=debug  # noisy"), (EnvEntry{"LEVEL", "debug"}));
    EXPECT_EQ(parseDotEnvLine("URL=http://x/#frag"), (EnvEntry{"URL", "http://x/#frag"}));
}

TEST(DotEnvLineTest, EmptyValue) {
    EXPECT_EQ(parseDotEnvLine("EMPTY="), (EnvEntry{"EMPTY", ""}));
}

TEST(DotEnvLineTest, IgnoredLines) {
    EXPECT_FALSE(parseDotEnvLine(""));
    EXPECT_FALSE(parseDotEnvLine("   "));
    EXPECT_FALSE(parseDotEnvLine("# KEY=value"));
    EXPECT_FALSE(parseDotEnvLine("no equals sign"));
    EXPECT_FALSE(parseDotEnvLine("=value"));
    EXPECT_FALSE(parseDotEnvLine("1KEY=value"));
    EXPECT_FALSE(parseDotEnvLine("BAD-NAME=value"));
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("error"), spdlog::level::err);
    EXPECT_EQ(parseLogLevel("info"), spdlog::level::info);
    EXPECT_EQ(parseLogLevel("verbose"), spdlog::level::info);
}

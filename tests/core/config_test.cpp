#include "fts/core/config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using fts::EngineConfig;
using fts::ErrorCode;
using fts::apply_env_overrides;
using fts::config_from_json;
using fts::load_config;
using json = nlohmann::json;

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    auto config = config_from_json(json::object());
    ASSERT_TRUE(config.is_ok());

    EXPECT_EQ(config.value().sync.max_retries, 3);
    EXPECT_EQ(config.value().sync.backoff_unit, std::chrono::milliseconds(1000));
    EXPECT_TRUE(config.value().store.synchronous_full);
    EXPECT_TRUE(config.value().sync.drain_on_reconnect);
}

TEST(ConfigTest, ReadsEverySection) {
    json doc = {
        {"store", {{"path", "/tmp/x.db"}, {"busy_timeout_ms", 100}}},
        {"sync", {{"max_retries", 5}, {"backoff_unit_ms", 250}, {"archive_retention_hours", 48},
                  {"drain_on_reconnect", false}}},
        {"remote", {{"host", "authority.local"}, {"port", 9443}, {"submit_path", "/submit"}, {"timeout_ms", 3000}}},
        {"logging", {{"level", "debug"}}}
    };

    auto config = config_from_json(doc);
    ASSERT_TRUE(config.is_ok());

    const EngineConfig& c = config.value();
    EXPECT_EQ(c.store.path, "/tmp/x.db");
    EXPECT_EQ(c.store.busy_timeout_ms, 100);
    EXPECT_EQ(c.sync.max_retries, 5);
    EXPECT_EQ(c.sync.backoff_unit, std::chrono::milliseconds(250));
    EXPECT_EQ(c.sync.archive_retention, std::chrono::hours(48));
    EXPECT_FALSE(c.sync.drain_on_reconnect);
    EXPECT_EQ(c.remote.host, "authority.local");
    EXPECT_EQ(c.remote.port, 9443);
    EXPECT_EQ(c.remote.submit_path, "/submit");
    EXPECT_EQ(c.remote.timeout_ms, 3000);
    EXPECT_EQ(c.logging.level, "debug");
}

TEST(ConfigTest, RejectsWrongTypes) {
    auto config = config_from_json(json{{"sync", {{"max_retries", "three"}}}});
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigTest, RejectsOutOfRangeValues) {
    EXPECT_TRUE(config_from_json(json{{"sync", {{"max_retries", -1}}}}).is_error());
    EXPECT_TRUE(config_from_json(json{{"sync", {{"backoff_unit_ms", 0}}}}).is_error());
    EXPECT_TRUE(config_from_json(json{{"store", {{"path", ""}}}}).is_error());
    EXPECT_TRUE(config_from_json(json::array()).is_error());
}

TEST(ConfigTest, LoadReportsMissingFile) {
    auto config = load_config("/nonexistent/fts-config.json");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::IOFailure);
}

TEST(ConfigTest, LoadParsesFile) {
    const auto path = std::filesystem::temp_directory_path() / "fts-config-test.json";
    {
        std::ofstream out(path);
        out << R"({"remote": {"port": 18080}})";
    }

    auto config = load_config(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().remote.port, 18080);
}

TEST(ConfigTest, EnvironmentOverridesFileValues) {
    ::setenv("FTS_DB_PATH", "/tmp/override.db", 1);
    ::setenv("FTS_REMOTE_PORT", "7001", 1);

    EngineConfig config;
    apply_env_overrides(config);

    ::unsetenv("FTS_DB_PATH");
    ::unsetenv("FTS_REMOTE_PORT");

    EXPECT_EQ(config.store.path, "/tmp/override.db");
    EXPECT_EQ(config.remote.port, 7001);
}

TEST(ConfigTest, InvalidPortOverrideIsIgnored) {
    ::setenv("FTS_REMOTE_PORT", "not-a-port", 1);

    EngineConfig config;
    apply_env_overrides(config);

    ::unsetenv("FTS_REMOTE_PORT");
    EXPECT_EQ(config.remote.port, 8080);
}

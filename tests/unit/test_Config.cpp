#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace sl::config;

class ConfigTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        file = fs::temp_directory_path() / ("siteline_config_" + std::to_string(::getpid()) + ".yaml");
    }

    void TearDown() override { fs::remove(file); }

    Config load(const std::string& yaml) const {
        sl::util::writeFile(file, yaml);
        return loadConfig(file);
    }
};

TEST_F(ConfigTest, ReadsEverySection) {
    const auto cfg = load(R"(
api:
  base_url: https://field.example.com/api/
  username: inspector
  token: s3cret
  request_timeout_seconds: 30
  endpoints:
    project_list: v2/projects
storage:
  root: /data/siteline
  cache_max_age_days: 7
upload:
  max_attempts: 3
  retry_delay_ms: 1500
  batch_poll:
    interval_ms: 500
    max_attempts: 8
  workers: 4
scheduler:
  enabled: false
  interval_hours: 12
database:
  host: db.internal
  port: 6543
  pool_size: 2
logging:
  log_dir: /tmp/siteline-logs
  console_log_level: warn
  subsystem_levels:
    upload: debug
)");

    EXPECT_EQ(cfg.api.base_url, "https://field.example.com/api/");
    EXPECT_EQ(cfg.api.username, "inspector");
    EXPECT_EQ(cfg.api.token, "s3cret");
    EXPECT_EQ(cfg.api.request_timeout_seconds, 30u);
    EXPECT_EQ(cfg.api.connect_timeout_seconds, 15u);
    EXPECT_EQ(cfg.api.endpoints.project_list, "v2/projects");
    EXPECT_EQ(cfg.api.endpoints.project_detail, "app/project/project");

    EXPECT_EQ(cfg.storage.root.string(), "/data/siteline");
    EXPECT_EQ(cfg.storage.assetCachePath().string(), "/data/siteline/digital_assets");
    EXPECT_EQ(cfg.storage.cache_max_age_days, 7u);

    EXPECT_EQ(cfg.upload.max_attempts, 3u);
    EXPECT_EQ(cfg.upload.retry_delay.count(), 1500);
    EXPECT_EQ(cfg.upload.batch_poll.interval.count(), 500);
    EXPECT_EQ(cfg.upload.batch_poll.max_attempts, 8u);
    EXPECT_EQ(cfg.upload.single_poll.interval.count(), 2000);
    EXPECT_EQ(cfg.upload.single_poll.max_attempts, 30u);
    EXPECT_EQ(cfg.upload.workers, 4u);

    EXPECT_FALSE(cfg.scheduler.enabled);
    EXPECT_EQ(cfg.scheduler.interval.count(), 12);

    EXPECT_EQ(cfg.database.host, "db.internal");
    EXPECT_EQ(cfg.database.port, 6543);
    EXPECT_EQ(cfg.database.name, "siteline");
    EXPECT_EQ(cfg.database.pool_size, 2u);

    EXPECT_EQ(cfg.logging.log_dir.string(), "/tmp/siteline-logs");
    EXPECT_EQ(cfg.logging.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.file_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.subsystem_levels.upload, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.subsystem_levels.db, spdlog::level::err);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    const auto cfg = load("api:\n  token: t\n");
    const Config def;

    EXPECT_EQ(cfg.storage.root.string(), def.storage.root.string());
    EXPECT_EQ(cfg.upload.max_attempts, 5u);
    EXPECT_EQ(cfg.upload.batch_poll.interval.count(), 3000);
    EXPECT_EQ(cfg.upload.batch_poll.max_attempts, 15u);
    EXPECT_TRUE(cfg.scheduler.enabled);
    EXPECT_EQ(cfg.scheduler.interval.count(), 6);
    EXPECT_EQ(cfg.database.password_env, "SITELINE_DB_PASSWORD");
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    EXPECT_ANY_THROW(load("api: [unterminated\n"));
}

TEST_F(ConfigTest, JsonDumpMasksToken) {
    const auto cfg = load("api:\n  token: s3cret\n  username: inspector\n");
    const nlohmann::json j = cfg;

    EXPECT_EQ(j["api"]["token"], "********");
    EXPECT_EQ(j["api"]["username"], "inspector");
    EXPECT_EQ(j["upload"]["batch_poll"]["interval_ms"], 3000);
    EXPECT_EQ(j["logging"]["subsystem_levels"]["http"], "warning");
    EXPECT_EQ(j.dump().find("s3cret"), std::string::npos);
}

TEST_F(ConfigTest, EmptyTokenIsNotMasked) {
    const nlohmann::json j = Config{};
    EXPECT_EQ(j["api"]["token"], "");
}

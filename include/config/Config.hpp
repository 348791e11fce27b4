#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sl::config {

struct EndpointsConfig {
    std::string project_list = "app/project/project_list";
    std::string project_detail = "app/project/project";
    std::string download_url = "storage/download/url";
    std::string upload_ticket = "storage/upload/ticket";
    std::string create_event_upload = "app/event/create_event_upload";
    std::string notice_event_upload = "app/event/notice_event_upload_success";
};

struct ApiConfig {
    std::string base_url = "https://localhost/api/";
    std::string username;
    std::string token;
    unsigned int connect_timeout_seconds = 15;
    unsigned int request_timeout_seconds = 60;
    unsigned int transfer_timeout_seconds = 600;
    EndpointsConfig endpoints;
};

struct StorageConfig {
    std::filesystem::path root = "/var/lib/siteline";
    std::string events_dir = "events";
    std::string asset_cache_dir = "digital_assets";
    std::string defect_image_dir = "history_defects";
    std::string scratch_dir = "sync_zip";
    unsigned int cache_max_age_days = 3;

    [[nodiscard]] std::filesystem::path eventsPath() const { return root / events_dir; }
    [[nodiscard]] std::filesystem::path assetCachePath() const { return root / asset_cache_dir; }
    [[nodiscard]] std::filesystem::path defectImagePath() const { return root / defect_image_dir; }
    [[nodiscard]] std::filesystem::path scratchPath() const { return root / scratch_dir; }
};

struct PollConfig {
    std::chrono::milliseconds interval{3000};
    unsigned int max_attempts = 15;
};

struct UploadConfig {
    unsigned int max_attempts = 5;
    std::chrono::milliseconds retry_delay{3000};
    PollConfig batch_poll{std::chrono::milliseconds(3000), 15};
    PollConfig single_poll{std::chrono::milliseconds(2000), 30};
    unsigned int workers = 2;
};

struct SchedulerConfig {
    bool enabled = true;
    std::chrono::hours interval{6};
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "siteline";
    std::string user = "siteline";
    std::string password_env = "SITELINE_DB_PASSWORD";
    unsigned int pool_size = 4;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum siteline = spdlog::level::info;  // startup/shutdown, facade results
    spdlog::level::level_enum sync     = spdlog::level::info;  // project diffing and scheduling
    spdlog::level::level_enum assets   = spdlog::level::info;  // tree resolution, downloads, eviction
    spdlog::level::level_enum upload   = spdlog::level::info;  // packaging, tickets, polling
    spdlog::level::level_enum http     = spdlog::level::warn;  // transport failures
    spdlog::level::level_enum db       = spdlog::level::err;   // failed transactions
    spdlog::level::level_enum storage  = spdlog::level::warn;  // local filesystem issues
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/siteline";
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    ApiConfig api;
    StorageConfig storage;
    UploadConfig upload;
    SchedulerConfig scheduler;
    DatabaseConfig database;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const ApiConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const UploadConfig& c);
void to_json(nlohmann::json& j, const PollConfig& c);
void to_json(nlohmann::json& j, const SchedulerConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

}

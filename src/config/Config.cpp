#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace sl::config {

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["api"]) YAML::convert<ApiConfig>::decode(node, cfg.api);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["upload"]) YAML::convert<UploadConfig>::decode(node, cfg.upload);
    if (auto node = root["scheduler"]) YAML::convert<SchedulerConfig>::decode(node, cfg.scheduler);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"api", c.api},
        {"storage", c.storage},
        {"upload", c.upload},
        {"scheduler", c.scheduler},
        {"database", c.database},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const ApiConfig& c) {
    j = {
        {"base_url", c.base_url},
        {"username", c.username},
        {"token", c.token.empty() ? "" : "********"},
        {"connect_timeout_seconds", c.connect_timeout_seconds},
        {"request_timeout_seconds", c.request_timeout_seconds},
        {"transfer_timeout_seconds", c.transfer_timeout_seconds},
        {"endpoints", {
            {"project_list", c.endpoints.project_list},
            {"project_detail", c.endpoints.project_detail},
            {"download_url", c.endpoints.download_url},
            {"upload_ticket", c.endpoints.upload_ticket},
            {"create_event_upload", c.endpoints.create_event_upload},
            {"notice_event_upload", c.endpoints.notice_event_upload}
        }}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"root", c.root.string()},
        {"events_dir", c.events_dir},
        {"asset_cache_dir", c.asset_cache_dir},
        {"defect_image_dir", c.defect_image_dir},
        {"scratch_dir", c.scratch_dir},
        {"cache_max_age_days", c.cache_max_age_days}
    };
}

void to_json(nlohmann::json& j, const PollConfig& c) {
    j = {
        {"interval_ms", c.interval.count()},
        {"max_attempts", c.max_attempts}
    };
}

void to_json(nlohmann::json& j, const UploadConfig& c) {
    j = {
        {"max_attempts", c.max_attempts},
        {"retry_delay_ms", c.retry_delay.count()},
        {"batch_poll", c.batch_poll},
        {"single_poll", c.single_poll},
        {"workers", c.workers}
    };
}

void to_json(nlohmann::json& j, const SchedulerConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"interval_hours", c.interval.count()}
    };
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"password_env", c.password_env},
        {"pool_size", c.pool_size}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto& sub = c.subsystem_levels;
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", {
            {"siteline", levelName(sub.siteline)},
            {"sync", levelName(sub.sync)},
            {"assets", levelName(sub.assets)},
            {"upload", levelName(sub.upload)},
            {"http", levelName(sub.http)},
            {"db", levelName(sub.db)},
            {"storage", levelName(sub.storage)}
        }}
    };
}

}

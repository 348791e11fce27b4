#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sl::config;

template<>
struct convert<EndpointsConfig> {
    static bool decode(const Node& node, EndpointsConfig& rhs) {
        if (!node.IsMap()) return false;
        const EndpointsConfig def;
        rhs.project_list = node["project_list"].as<std::string>(def.project_list);
        rhs.project_detail = node["project_detail"].as<std::string>(def.project_detail);
        rhs.download_url = node["download_url"].as<std::string>(def.download_url);
        rhs.upload_ticket = node["upload_ticket"].as<std::string>(def.upload_ticket);
        rhs.create_event_upload = node["create_event_upload"].as<std::string>(def.create_event_upload);
        rhs.notice_event_upload = node["notice_event_upload"].as<std::string>(def.notice_event_upload);
        return true;
    }
};

template<>
struct convert<ApiConfig> {
    static bool decode(const Node& node, ApiConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_url = node["base_url"].as<std::string>("https://localhost/api/");
        rhs.username = node["username"].as<std::string>("");
        rhs.token = node["token"].as<std::string>("");
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(15);
        rhs.request_timeout_seconds = node["request_timeout_seconds"].as<unsigned int>(60);
        rhs.transfer_timeout_seconds = node["transfer_timeout_seconds"].as<unsigned int>(600);
        if (node["endpoints"]) rhs.endpoints = node["endpoints"].as<EndpointsConfig>();
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("/var/lib/siteline");
        rhs.events_dir = node["events_dir"].as<std::string>("events");
        rhs.asset_cache_dir = node["asset_cache_dir"].as<std::string>("digital_assets");
        rhs.defect_image_dir = node["defect_image_dir"].as<std::string>("history_defects");
        rhs.scratch_dir = node["scratch_dir"].as<std::string>("sync_zip");
        rhs.cache_max_age_days = node["cache_max_age_days"].as<unsigned int>(3);
        return true;
    }
};

template<>
struct convert<PollConfig> {
    static bool decode(const Node& node, PollConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.interval = std::chrono::milliseconds(node["interval_ms"].as<unsigned int>(static_cast<unsigned int>(rhs.interval.count())));
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(rhs.max_attempts);
        return true;
    }
};

template<>
struct convert<UploadConfig> {
    static bool decode(const Node& node, UploadConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(5);
        rhs.retry_delay = std::chrono::milliseconds(node["retry_delay_ms"].as<unsigned int>(3000));
        if (node["batch_poll"]) YAML::convert<PollConfig>::decode(node["batch_poll"], rhs.batch_poll);
        if (node["single_poll"]) YAML::convert<PollConfig>::decode(node["single_poll"], rhs.single_poll);
        rhs.workers = node["workers"].as<unsigned int>(2);
        return true;
    }
};

template<>
struct convert<SchedulerConfig> {
    static bool decode(const Node& node, SchedulerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.interval = std::chrono::hours(node["interval_hours"].as<unsigned int>(6));
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("siteline");
        rhs.user = node["user"].as<std::string>("siteline");
        rhs.password_env = node["password_env"].as<std::string>("SITELINE_DB_PASSWORD");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.siteline = spdlog::level::from_str(node["siteline"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.assets = spdlog::level::from_str(node["assets"].as<std::string>("info"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/siteline");
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}

#include "sync/model/Project.hpp"

#include <pqxx/row>

using namespace sl::sync::model;

ProjectSyncRecord::ProjectSyncRecord(std::string uid, std::string hash, const int64_t revision)
    : project_uid(std::move(uid)), content_hash(std::move(hash)), local_revision_ts(revision) {}

ProjectSyncRecord::ProjectSyncRecord(const pqxx::row& row)
    : project_uid(row.at("project_uid").as<std::string>()),
      content_hash(row.at("content_hash").as<std::string>()),
      local_revision_ts(row.at("local_revision_ts").as<int64_t>()) {}

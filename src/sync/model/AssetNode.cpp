#include "sync/model/AssetNode.hpp"

#include <boost/algorithm/string.hpp>
#include <nlohmann/json.hpp>
#include <pqxx/result>
#include <stdexcept>

using namespace sl::sync::model;

namespace {

template <typename T>
std::optional<T> optionalField(const pqxx::row& row, const char* name) {
    const auto field = row.at(name);
    if (field.is_null()) return std::nullopt;
    return field.as<T>();
}

std::set<std::string> splitOwners(const std::string& joined) {
    std::set<std::string> owners;
    if (joined.empty()) return owners;
    std::vector<std::string> parts;
    boost::split(parts, joined, boost::is_any_of(","));
    for (auto& p : parts) if (!p.empty()) owners.insert(std::move(p));
    return owners;
}

}

AssetNode::AssetNode(const pqxx::row& row)
    : node_id(row.at("node_id").as<std::string>()),
      parent_id(optionalField<std::string>(row, "parent_id")),
      remote_id(optionalField<std::string>(row, "remote_id")),
      file_type(optionalField<std::string>(row, "file_type")),
      name(row.at("name").as<std::string>()),
      kind(kindFromString(row.at("kind").as<std::string>())),
      size_bytes(optionalField<uintmax_t>(row, "size_bytes")),
      status(statusFromString(row.at("download_status").as<std::string>())),
      owning_project_uids(splitOwners(row.at("owners").as<std::string>(""))),
      tree_path(row.at("tree_path").as<std::string>()),
      is_risk_matrix(row.at("is_risk_matrix").as<bool>()) {
    if (const auto p = optionalField<std::string>(row, "local_path")) local_path = *p;
}

bool AssetNode::hasValidLocalFile() const {
    if (status != Status::Completed || !local_path) return false;
    std::error_code ec;
    return std::filesystem::is_regular_file(*local_path, ec);
}

void sl::sync::model::to_json(nlohmann::json& j, const AssetNode& node) {
    j = {
        {"node_id", node.node_id},
        {"name", node.name},
        {"kind", to_string(node.kind)},
        {"status", to_string(node.status)},
        {"tree_path", node.tree_path},
        {"is_risk_matrix", node.is_risk_matrix},
        {"owners", node.owning_project_uids}
    };
    j["parent_id"] = node.parent_id ? nlohmann::json(*node.parent_id) : nlohmann::json(nullptr);
    j["remote_id"] = node.remote_id ? nlohmann::json(*node.remote_id) : nlohmann::json(nullptr);
    j["file_type"] = node.file_type ? nlohmann::json(*node.file_type) : nlohmann::json(nullptr);
    j["size_bytes"] = node.size_bytes ? nlohmann::json(*node.size_bytes) : nlohmann::json(nullptr);
    j["local_path"] = node.local_path ? nlohmann::json(node.local_path->string()) : nlohmann::json(nullptr);
}

std::string sl::sync::model::to_string(const AssetNode::Kind& kind) {
    switch (kind) {
        case AssetNode::Kind::Folder: return "folder";
        case AssetNode::Kind::File: return "file";
        default: throw std::invalid_argument("Unknown AssetNode kind");
    }
}

std::string sl::sync::model::to_string(const AssetNode::Status& status) {
    switch (status) {
        case AssetNode::Status::Pending: return "pending";
        case AssetNode::Status::Downloading: return "downloading";
        case AssetNode::Status::Completed: return "completed";
        case AssetNode::Status::Failed: return "failed";
        default: throw std::invalid_argument("Unknown AssetNode status");
    }
}

AssetNode::Kind sl::sync::model::kindFromString(const std::string& str) {
    if (str == "folder") return AssetNode::Kind::Folder;
    if (str == "file") return AssetNode::Kind::File;
    throw std::invalid_argument("Unknown AssetNode kind: " + str);
}

AssetNode::Status sl::sync::model::statusFromString(const std::string& str) {
    if (str == "pending") return AssetNode::Status::Pending;
    if (str == "downloading") return AssetNode::Status::Downloading;
    if (str == "completed") return AssetNode::Status::Completed;
    if (str == "failed") return AssetNode::Status::Failed;
    throw std::invalid_argument("Unknown AssetNode status: " + str);
}

std::vector<std::shared_ptr<AssetNode>> sl::sync::model::asset_nodes_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<AssetNode>> nodes;
    nodes.reserve(res.size());
    for (const auto& row : res) nodes.emplace_back(std::make_shared<AssetNode>(row));
    return nodes;
}

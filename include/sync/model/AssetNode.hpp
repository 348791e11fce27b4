#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pqxx {
class row;
class result;
}

namespace sl::sync::model {

struct AssetNode {
    enum class Kind { Folder, File };
    enum class Status { Pending, Downloading, Completed, Failed };

    std::string node_id;
    std::optional<std::string> parent_id, remote_id, file_type;
    std::string name;
    Kind kind{Kind::File};
    std::optional<uintmax_t> size_bytes;
    Status status{Status::Pending};
    std::optional<std::filesystem::path> local_path;
    std::set<std::string> owning_project_uids;
    std::string tree_path;
    bool is_risk_matrix{false};

    AssetNode() = default;
    explicit AssetNode(const pqxx::row& row);

    [[nodiscard]] bool isFolder() const { return !remote_id; }

    // COMPLETED with a local file that still exists.
    [[nodiscard]] bool hasValidLocalFile() const;
};

void to_json(nlohmann::json& j, const AssetNode& node);

std::string to_string(const AssetNode::Kind& kind);
std::string to_string(const AssetNode::Status& status);
AssetNode::Kind kindFromString(const std::string& str);
AssetNode::Status statusFromString(const std::string& str);

std::vector<std::shared_ptr<AssetNode>> asset_nodes_from_pq_res(const pqxx::result& res);

}

#include "db/query/sync/Asset.hpp"
#include "db/Transactions.hpp"

using namespace sl::db::query::sync;
using namespace sl::sync::model;
using sl::sync::store::ReleaseResult;

static std::optional<std::string> pathParam(const std::optional<std::filesystem::path>& path) {
    if (!path) return std::nullopt;
    return path->string();
}

static std::optional<int64_t> sizeParam(const std::optional<uintmax_t>& size) {
    if (!size) return std::nullopt;
    return static_cast<int64_t>(*size);
}

Asset::NodePtr Asset::findByNodeId(const std::string& nodeId) {
    return Transactions::exec("Asset::findByNodeId", [&](pqxx::work& txn) -> NodePtr {
        const auto res = txn.exec(pqxx::prepped{"get_asset_node"}, pqxx::params{nodeId});
        if (res.empty()) return nullptr;
        return std::make_shared<AssetNode>(res.one_row());
    });
}

Asset::NodePtr Asset::findByRemoteId(const std::string& remoteId) {
    return Transactions::exec("Asset::findByRemoteId", [&](pqxx::work& txn) -> NodePtr {
        const auto res = txn.exec(pqxx::prepped{"get_asset_node_by_remote_id"}, pqxx::params{remoteId});
        if (res.empty()) return nullptr;
        return std::make_shared<AssetNode>(res.one_row());
    });
}

std::vector<Asset::NodePtr> Asset::listOwnedBy(const std::string& projectUid) {
    return Transactions::exec("Asset::listOwnedBy", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"list_asset_nodes_by_owner"}, pqxx::params{projectUid});
        return asset_nodes_from_pq_res(res);
    });
}

void Asset::upsert(const A& node) {
    Transactions::exec("Asset::upsert", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(node.node_id);
        p.append(node.parent_id);
        p.append(node.remote_id);
        p.append(node.file_type);
        p.append(node.name);
        p.append(to_string(node.kind));
        p.append(sizeParam(node.size_bytes));
        p.append(node.tree_path);
        p.append(node.is_risk_matrix);

        txn.exec(pqxx::prepped{"upsert_asset_node"}, p);
    });
}

void Asset::updateMetadata(const std::string& nodeId, const std::string& name, const std::optional<uintmax_t> sizeBytes) {
    Transactions::exec("Asset::updateMetadata", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(nodeId);
        p.append(name);
        p.append(sizeParam(sizeBytes));

        txn.exec(pqxx::prepped{"update_asset_node_metadata"}, p);
    });
}

void Asset::updateFileType(const std::string& nodeId, const std::string& fileType) {
    Transactions::exec("Asset::updateFileType", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"update_asset_node_file_type"}, pqxx::params{nodeId, fileType});
    });
}

void Asset::updateStatus(const std::string& nodeId, const A::Status status,
                         const std::optional<std::filesystem::path>& localPath) {
    Transactions::exec("Asset::updateStatus", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(nodeId);
        p.append(to_string(status));
        p.append(pathParam(localPath));

        txn.exec(pqxx::prepped{"update_asset_node_status"}, p);
    });
}

void Asset::addOwner(const std::string& nodeId, const std::string& projectUid) {
    Transactions::exec("Asset::addOwner", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"add_asset_node_owner"}, pqxx::params{nodeId, projectUid});
    });
}

ReleaseResult Asset::releaseOwner(const std::string& nodeId, const std::string& projectUid) {
    return Transactions::exec("Asset::releaseOwner", [&](pqxx::work& txn) {
        ReleaseResult result;

        const auto locked = txn.exec(pqxx::prepped{"lock_asset_node"}, pqxx::params{nodeId});
        if (locked.empty()) return result;

        txn.exec(pqxx::prepped{"delete_asset_node_owner"}, pqxx::params{nodeId, projectUid});

        const auto remaining = txn.exec(pqxx::prepped{"count_asset_node_owners"}, pqxx::params{nodeId})
                                   .one_field().as<int64_t>();
        if (remaining > 0) return result;

        txn.exec(pqxx::prepped{"delete_asset_node"}, pqxx::params{nodeId});
        result.evicted = true;
        if (const auto field = locked.one_row().at("local_path"); !field.is_null())
            result.local_path = std::filesystem::path(field.as<std::string>());
        return result;
    });
}

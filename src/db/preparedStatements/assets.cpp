#include "db/DBConnection.hpp"

namespace {

constexpr auto* NODE_COLUMNS =
    "n.node_id, n.parent_id, n.remote_id, n.file_type, n.name, n.kind, n.size_bytes, n.download_status, "
    "n.local_path, n.tree_path, n.is_risk_matrix, "
    "COALESCE((SELECT string_agg(o.project_uid, ',' ORDER BY o.project_uid) "
    "FROM asset_node_owner o WHERE o.node_id = n.node_id), '') AS owners";

}

void sl::db::DBConnection::initPreparedAssets() const {
    const std::string cols = NODE_COLUMNS;

    conn_->prepare("get_asset_node", "SELECT " + cols + " FROM asset_node n WHERE n.node_id = $1");

    conn_->prepare("get_asset_node_by_remote_id", "SELECT " + cols + " FROM asset_node n WHERE n.remote_id = $1");

    conn_->prepare("list_asset_nodes_by_owner",
                   "SELECT " + cols + " FROM asset_node n "
                   "JOIN asset_node_owner own ON own.node_id = n.node_id AND own.project_uid = $1 "
                   "ORDER BY n.tree_path");

    conn_->prepare("upsert_asset_node",
                   "INSERT INTO asset_node (node_id, parent_id, remote_id, file_type, name, kind, size_bytes, "
                   "tree_path, is_risk_matrix) VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9) "
                   "ON CONFLICT (node_id) DO UPDATE SET "
                   "parent_id = EXCLUDED.parent_id, "
                   "remote_id = COALESCE(EXCLUDED.remote_id, asset_node.remote_id), "
                   "file_type = COALESCE(EXCLUDED.file_type, asset_node.file_type), "
                   "name = EXCLUDED.name, kind = EXCLUDED.kind, "
                   "size_bytes = COALESCE(EXCLUDED.size_bytes, asset_node.size_bytes), "
                   "tree_path = EXCLUDED.tree_path, is_risk_matrix = EXCLUDED.is_risk_matrix, "
                   "updated_at = CURRENT_TIMESTAMP");

    conn_->prepare("update_asset_node_metadata",
                   "UPDATE asset_node SET name = $2, size_bytes = COALESCE($3, size_bytes), "
                   "updated_at = CURRENT_TIMESTAMP WHERE node_id = $1");

    conn_->prepare("update_asset_node_file_type",
                   "UPDATE asset_node SET file_type = $2, updated_at = CURRENT_TIMESTAMP WHERE node_id = $1");

    conn_->prepare("update_asset_node_status",
                   "UPDATE asset_node SET download_status = $2, local_path = $3, updated_at = CURRENT_TIMESTAMP "
                   "WHERE node_id = $1");

    conn_->prepare("add_asset_node_owner",
                   "INSERT INTO asset_node_owner (node_id, project_uid) VALUES ($1, $2) ON CONFLICT DO NOTHING");

    conn_->prepare("lock_asset_node", "SELECT local_path FROM asset_node WHERE node_id = $1 FOR UPDATE");

    conn_->prepare("delete_asset_node_owner",
                   "DELETE FROM asset_node_owner WHERE node_id = $1 AND project_uid = $2");

    conn_->prepare("count_asset_node_owners", "SELECT COUNT(*) FROM asset_node_owner WHERE node_id = $1");

    conn_->prepare("delete_asset_node", "DELETE FROM asset_node WHERE node_id = $1");
}

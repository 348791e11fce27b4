#pragma once

#include "sync/model/AssetNode.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sl::sync::store {

struct ReleaseResult {
    bool evicted{false};
    std::optional<std::filesystem::path> local_path;  // set when evicted and a file was cached
};

class AssetStore {
public:
    using NodePtr = std::shared_ptr<model::AssetNode>;

    virtual ~AssetStore() = default;

    virtual NodePtr findByNodeId(const std::string& nodeId) = 0;
    virtual NodePtr findByRemoteId(const std::string& remoteId) = 0;
    virtual std::vector<NodePtr> listOwnedBy(const std::string& projectUid) = 0;

    // Insert or refresh metadata keyed by node_id. Ownership and download state are left untouched
    // on existing rows.
    virtual void upsert(const model::AssetNode& node) = 0;

    virtual void updateMetadata(const std::string& nodeId, const std::string& name, std::optional<uintmax_t> sizeBytes) = 0;
    virtual void updateFileType(const std::string& nodeId, const std::string& fileType) = 0;
    virtual void updateStatus(const std::string& nodeId, model::AssetNode::Status status,
                              const std::optional<std::filesystem::path>& localPath) = 0;

    // Atomic per node. Adding an existing owner is a no-op.
    virtual void addOwner(const std::string& nodeId, const std::string& projectUid) = 0;

    // Atomic per node: drops the owner and deletes the node once no owner remains.
    virtual ReleaseResult releaseOwner(const std::string& nodeId, const std::string& projectUid) = 0;
};

}

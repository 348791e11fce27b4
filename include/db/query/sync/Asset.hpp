#pragma once

#include "sync/store/AssetStore.hpp"

namespace sl::db::query::sync {

class Asset final : public sl::sync::store::AssetStore {
    using A = sl::sync::model::AssetNode;

public:
    NodePtr findByNodeId(const std::string& nodeId) override;
    NodePtr findByRemoteId(const std::string& remoteId) override;
    std::vector<NodePtr> listOwnedBy(const std::string& projectUid) override;

    void upsert(const A& node) override;
    void updateMetadata(const std::string& nodeId, const std::string& name, std::optional<uintmax_t> sizeBytes) override;
    void updateFileType(const std::string& nodeId, const std::string& fileType) override;
    void updateStatus(const std::string& nodeId, A::Status status,
                      const std::optional<std::filesystem::path>& localPath) override;

    void addOwner(const std::string& nodeId, const std::string& projectUid) override;
    sl::sync::store::ReleaseResult releaseOwner(const std::string& nodeId, const std::string& projectUid) override;
};

}

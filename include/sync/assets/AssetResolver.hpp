#pragma once

#include "sync/assets/Downloader.hpp"
#include "sync/assets/ReferenceTracker.hpp"
#include "sync/store/AssetStore.hpp"

#include <filesystem>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sl::sync::assets {

struct ResolveReport {
    std::string strategy;
    unsigned int succeeded{}, total{}, evicted{};
    std::vector<std::string> failures;  // "<remoteId>: <reason>"

    [[nodiscard]] bool complete() const { return succeeded == total; }
};

// Materializes a project's asset tree, downloads what is missing and prunes what is gone.
class AssetResolver {
public:
    AssetResolver(std::shared_ptr<remote::Api> api, std::shared_ptr<store::AssetStore> store,
                  const std::filesystem::path& cacheDir);

    // Per-node failures are isolated and counted; only persistence failures of the ownership
    // snapshot escape as exceptions.
    ResolveReport process(const std::string& projectUid, const nlohmann::json& detail);

    ResolveReport retryFailed(const std::string& projectUid);

    unsigned int clearProject(const std::string& projectUid);

    // Cached path when the node is COMPLETED and its file exists; a vanished file regresses it to FAILED.
    std::optional<std::filesystem::path> localFile(const std::string& remoteId);

    std::vector<store::AssetStore::NodePtr> nodes(const std::string& projectUid) const;

private:
    std::shared_ptr<store::AssetStore> store_;
    Downloader downloader_;
    ReferenceTracker tracker_;

    // Returns the id the node is stored under (an existing node sharing the remote id wins).
    std::string materialize(const model::AssetNode& node, const std::string& projectUid);

    void ensureCached(const std::string& nodeId, ResolveReport& report);
};

}

#include "sync/assets/AssetResolver.hpp"
#include "sync/assets/TreeParser.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <set>

using namespace sl::sync::assets;
using namespace sl::sync::model;
using namespace sl::log;

AssetResolver::AssetResolver(std::shared_ptr<remote::Api> api, std::shared_ptr<store::AssetStore> store,
                             const std::filesystem::path& cacheDir)
    : store_(store), downloader_(std::move(api), store, cacheDir), tracker_(store) {}

std::string AssetResolver::materialize(const AssetNode& node, const std::string& projectUid) {
    std::string storedId = node.node_id;

    if (node.remote_id) {
        if (const auto existing = store_->findByRemoteId(*node.remote_id)) {
            storedId = existing->node_id;
            store_->updateMetadata(storedId, node.name, node.size_bytes);
            if (node.file_type && node.file_type != existing->file_type)
                store_->updateFileType(storedId, *node.file_type);
        } else {
            auto fresh = node;
            fresh.status = AssetNode::Status::Pending;
            fresh.local_path.reset();
            fresh.owning_project_uids.clear();
            store_->upsert(fresh);
        }
    } else {
        store_->upsert(node);
    }

    tracker_.claim(storedId, projectUid);
    return storedId;
}

void AssetResolver::ensureCached(const std::string& nodeId, ResolveReport& report) {
    ++report.total;

    const auto node = store_->findByNodeId(nodeId);
    if (!node) {
        report.failures.push_back(nodeId + ": node vanished before download");
        return;
    }

    if (node->hasValidLocalFile()) {
        ++report.succeeded;
        return;
    }

    if (node->status == AssetNode::Status::Completed)
        Registry::assets()->warn("[AssetResolver] Cached file for {} is missing, downloading again", nodeId);

    if (const auto res = downloader_.download(*node)) ++report.succeeded;
    else report.failures.push_back(node->remote_id.value_or(nodeId) + ": " + res.message);
}

ResolveReport AssetResolver::process(const std::string& projectUid, const nlohmann::json& detail) {
    const auto previous = tracker_.snapshot(projectUid);

    auto parsed = TreeParser::parse(detail);

    ResolveReport report;
    report.strategy = parsed.strategy;

    std::set<std::string> current;
    std::vector<std::string> files;

    for (const auto& node : parsed.nodes) {
        try {
            const auto id = materialize(node, projectUid);
            if (!current.insert(id).second) continue;
            if (!node.isFolder()) files.push_back(id);
        } catch (const std::exception& e) {
            Registry::assets()->error("[AssetResolver] Failed to record node {} for project {}: {}",
                                      node.node_id, projectUid, e.what());
            if (!node.isFolder()) {
                ++report.total;
                report.failures.push_back(node.remote_id.value_or(node.node_id) + ": " + e.what());
            }
        }
    }

    for (const auto& id : files) {
        try {
            ensureCached(id, report);
        } catch (const std::exception& e) {
            Registry::assets()->error("[AssetResolver] Failed to check cache state of {}: {}", id, e.what());
            report.failures.push_back(id + ": " + e.what());
        }
    }

    report.evicted = tracker_.prune(projectUid, previous, current);

    Registry::assets()->info("[AssetResolver] Project {}: {}/{} assets cached (strategy: {}, evicted: {})",
                             projectUid, report.succeeded, report.total,
                             report.strategy.empty() ? "none" : report.strategy, report.evicted);
    return report;
}

ResolveReport AssetResolver::retryFailed(const std::string& projectUid) {
    ResolveReport report;
    for (const auto& node : store_->listOwnedBy(projectUid)) {
        if (!node || node->isFolder() || node->hasValidLocalFile()) continue;
        if (node->status == AssetNode::Status::Downloading) continue;

        try {
            ensureCached(node->node_id, report);
        } catch (const std::exception& e) {
            report.failures.push_back(node->node_id + ": " + e.what());
        }
    }

    Registry::assets()->info("[AssetResolver] Retried {} downloads for {}, {} succeeded",
                             report.total, projectUid, report.succeeded);
    return report;
}

unsigned int AssetResolver::clearProject(const std::string& projectUid) {
    const auto evicted = tracker_.releaseProject(projectUid);
    Registry::assets()->info("[AssetResolver] Released assets of {}, {} evicted", projectUid, evicted);
    return evicted;
}

std::optional<std::filesystem::path> AssetResolver::localFile(const std::string& remoteId) {
    const auto node = store_->findByRemoteId(remoteId);
    if (!node) return std::nullopt;
    if (node->hasValidLocalFile()) return node->local_path;

    if (node->status == AssetNode::Status::Completed) {
        Registry::assets()->warn("[AssetResolver] Cached file for {} vanished, marking FAILED", remoteId);
        store_->updateStatus(node->node_id, AssetNode::Status::Failed, std::nullopt);
    }
    return std::nullopt;
}

std::vector<sl::sync::store::AssetStore::NodePtr> AssetResolver::nodes(const std::string& projectUid) const {
    return store_->listOwnedBy(projectUid);
}

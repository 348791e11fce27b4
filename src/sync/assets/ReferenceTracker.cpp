#include "sync/assets/ReferenceTracker.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

using namespace sl::sync::assets;
using namespace sl::log;

ReferenceTracker::ReferenceTracker(std::shared_ptr<store::AssetStore> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("ReferenceTracker requires an asset store");
}

ReferenceTracker::Snapshot ReferenceTracker::snapshot(const std::string& projectUid) const {
    return store_->listOwnedBy(projectUid);
}

void ReferenceTracker::claim(const std::string& nodeId, const std::string& projectUid) const {
    store_->addOwner(nodeId, projectUid);
}

bool ReferenceTracker::release(const std::string& nodeId, const std::string& projectUid) const {
    const auto res = store_->releaseOwner(nodeId, projectUid);
    if (!res.evicted) return false;

    if (res.local_path) util::removeQuietly(*res.local_path);
    Registry::assets()->debug("[ReferenceTracker] Evicted orphan node {}", nodeId);
    return true;
}

unsigned int ReferenceTracker::prune(const std::string& projectUid, const Snapshot& previous,
                                     const std::set<std::string>& current) const {
    unsigned int evicted = 0;
    for (const auto& node : previous) {
        if (!node || node->isFolder() || current.contains(node->node_id)) continue;

        try {
            if (release(node->node_id, projectUid)) ++evicted;
        } catch (const std::exception& e) {
            Registry::assets()->error("[ReferenceTracker] Failed to release {} from project {}: {}",
                                      node->node_id, projectUid, e.what());
        }
    }

    if (evicted) Registry::assets()->info("[ReferenceTracker] Pruned {} orphaned nodes after syncing {}", evicted, projectUid);
    return evicted;
}

unsigned int ReferenceTracker::releaseProject(const std::string& projectUid) const {
    unsigned int evicted = 0;
    for (const auto& node : store_->listOwnedBy(projectUid))
        if (node && release(node->node_id, projectUid)) ++evicted;
    return evicted;
}

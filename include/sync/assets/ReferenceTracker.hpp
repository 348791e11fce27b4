#pragma once

#include "sync/store/AssetStore.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sl::sync::assets {

// Owner sets per cached node. A node and its file go away only when the last owner releases it.
class ReferenceTracker {
public:
    using Snapshot = std::vector<store::AssetStore::NodePtr>;

    explicit ReferenceTracker(std::shared_ptr<store::AssetStore> store);

    // Nodes the project owned before this pass; take it before any claim().
    Snapshot snapshot(const std::string& projectUid) const;

    void claim(const std::string& nodeId, const std::string& projectUid) const;

    // Releases the project's ownership of previously owned file nodes absent from `current`.
    // Returns the number of nodes evicted.
    unsigned int prune(const std::string& projectUid, const Snapshot& previous,
                       const std::set<std::string>& current) const;

    // Releases every node the project owns, folders included. Returns the number evicted.
    unsigned int releaseProject(const std::string& projectUid) const;

private:
    std::shared_ptr<store::AssetStore> store_;

    bool release(const std::string& nodeId, const std::string& projectUid) const;
};

}

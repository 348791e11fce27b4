#pragma once

#include "sync/assets/AssetResolver.hpp"
#include "sync/model/Project.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sl::remote { class Api; }
namespace sl::sync::store { class ProjectStore; }

namespace sl::sync::project {

class DefectCache;

struct SyncReport {
    std::vector<std::string> full_updates, counter_updates;
    std::vector<std::pair<std::string, std::string>> failures;  // (projectUid, reason)
    std::map<std::string, assets::ResolveReport> assets;

    [[nodiscard]] bool ok() const { return failures.empty(); }
    [[nodiscard]] std::string summary() const;
};

// Diffs remote project hashes against the hash store and re-fetches changed projects only.
class Coordinator {
public:
    Coordinator(std::shared_ptr<remote::Api> api,
                std::shared_ptr<store::ProjectStore> store,
                std::shared_ptr<assets::AssetResolver> resolver,
                std::shared_ptr<DefectCache> defects);

    static bool needsDetailFetch(const std::optional<model::ProjectSyncRecord>& local, const model::Project& remote);

    // Throws when the project list cannot be fetched; per-project failures land in the report.
    SyncReport syncAll();

    // Throws std::invalid_argument when the project is absent from the remote list.
    SyncReport syncProject(const std::string& projectUid, bool force = false);

private:
    std::shared_ptr<remote::Api> api_;
    std::shared_ptr<store::ProjectStore> store_;
    std::shared_ptr<assets::AssetResolver> resolver_;
    std::shared_ptr<DefectCache> defects_;

    void apply(const model::Project& remote, bool force, SyncReport& report);
    void fullUpdate(const model::Project& remote, SyncReport& report);
};

}

#include "sync/project/Coordinator.hpp"
#include "sync/project/DefectCache.hpp"
#include "sync/store/ProjectStore.hpp"
#include "remote/Api.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace sl::sync::project;
using namespace sl::sync::model;
using namespace sl::log;

std::string SyncReport::summary() const {
    std::string out = fmt::format("{} projects updated, {} unchanged, {} failed",
                                  full_updates.size(), counter_updates.size(), failures.size());
    for (const auto& [uid, r] : assets)
        out += fmt::format("\nproject={} | assets {}/{}", uid, r.succeeded, r.total);
    for (const auto& [uid, reason] : failures)
        out += fmt::format("\nproject={} | FAIL | {}", uid, reason);
    return out;
}

Coordinator::Coordinator(std::shared_ptr<remote::Api> api,
                         std::shared_ptr<store::ProjectStore> store,
                         std::shared_ptr<assets::AssetResolver> resolver,
                         std::shared_ptr<DefectCache> defects)
    : api_(std::move(api)), store_(std::move(store)), resolver_(std::move(resolver)), defects_(std::move(defects)) {
    if (!api_ || !store_ || !resolver_) throw std::invalid_argument("Coordinator requires api, store and resolver");
}

bool Coordinator::needsDetailFetch(const std::optional<ProjectSyncRecord>& local, const Project& remote) {
    return !local || local->content_hash != remote.content_hash;
}

SyncReport Coordinator::syncAll() {
    const auto projects = api_->listProjects();
    Registry::sync()->info("[Coordinator] Remote lists {} projects", projects.size());

    SyncReport report;
    for (const auto& p : projects) apply(p, false, report);

    Registry::sync()->info("[Coordinator] Sync pass finished: {}", report.summary());
    return report;
}

SyncReport Coordinator::syncProject(const std::string& projectUid, const bool force) {
    const auto projects = api_->listProjects();
    const auto it = std::ranges::find_if(projects, [&](const Project& p) { return p.uid == projectUid; });
    if (it == projects.end()) throw std::invalid_argument("project not found on server: " + projectUid);

    SyncReport report;
    apply(*it, force, report);
    return report;
}

void Coordinator::apply(const Project& remote, const bool force, SyncReport& report) {
    try {
        const auto local = store_->getRecord(remote.uid);

        if (!force && !needsDetailFetch(local, remote)) {
            store_->updateCounters(remote.uid, remote.defect_count, remote.event_count);
            report.counter_updates.push_back(remote.uid);
            Registry::sync()->debug("[Coordinator] {} unchanged, counters refreshed", remote.uid);
            return;
        }

        fullUpdate(remote, report);
    } catch (const std::exception& e) {
        Registry::sync()->error("[Coordinator] Sync of project {} failed: {}", remote.uid, e.what());
        report.failures.emplace_back(remote.uid, e.what());
    }
}

void Coordinator::fullUpdate(const Project& remote, SyncReport& report) {
    store_->upsertProject(remote);

    const auto detail = api_->getProjectDetail(remote.uid);
    store_->saveDetail(remote.uid, detail.dump());

    report.assets[remote.uid] = resolver_->process(remote.uid, detail);

    if (defects_) {
        try {
            defects_->cache(remote.uid, detail);
        } catch (const std::exception& e) {
            Registry::sync()->warn("[Coordinator] Defect cache for {} failed: {}", remote.uid, e.what());
        }
    }

    store_->updateCounters(remote.uid, remote.defect_count, remote.event_count);
    store_->commitHash(remote.uid, remote.content_hash);
    report.full_updates.push_back(remote.uid);

    Registry::sync()->info("[Coordinator] {} updated to hash {}", remote.uid, remote.content_hash);
}

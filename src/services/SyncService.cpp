#include "services/SyncService.hpp"
#include "services/StorageJanitor.hpp"
#include "concurrency/ThreadPool.hpp"
#include "remote/Api.hpp"
#include "sync/assets/AssetResolver.hpp"
#include "sync/project/Coordinator.hpp"
#include "sync/project/DefectCache.hpp"
#include "sync/store/EventStore.hpp"
#include "sync/store/ProjectStore.hpp"
#include "sync/upload/EventPackager.hpp"
#include "sync/upload/Orchestrator.hpp"
#include "sync/upload/Retry.hpp"
#include "sync/upload/TicketClient.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <set>

using namespace sl::services;
using namespace sl::sync;
using namespace sl::sync::model;
using namespace sl::log;
namespace fs = std::filesystem;

SyncService::SyncService(Deps deps, const config::Config& cfg)
    : deps_(std::move(deps)),
      uploadCfg_(cfg.upload),
      eventsDir_(cfg.storage.eventsPath()),
      defectImageDir_(cfg.storage.defectImagePath()),
      progress_(std::make_shared<ProgressTracker>()) {
    if (!deps_.api || !deps_.projects || !deps_.assets || !deps_.events)
        throw std::invalid_argument("SyncService requires api, project, asset and event stores");

    if (uploadCfg_.workers > 1) pool_ = std::make_shared<concurrency::ThreadPool>(uploadCfg_.workers);

    resolver_ = std::make_shared<assets::AssetResolver>(deps_.api, deps_.assets, cfg.storage.assetCachePath());
    const auto defects = std::make_shared<project::DefectCache>(deps_.api, deps_.projects, cfg.storage.defectImagePath());
    coordinator_ = std::make_shared<project::Coordinator>(deps_.api, deps_.projects, resolver_, defects);
    packager_ = std::make_shared<upload::EventPackager>(cfg.storage.eventsPath(), cfg.storage.scratchPath());
    tickets_ = std::make_shared<upload::TicketClient>(deps_.api);
    janitor_ = std::make_shared<StorageJanitor>(cfg.storage);
}

SyncService::~SyncService() {
    if (pool_) pool_->stop();
}

OpResult SyncService::syncProject(const std::string& projectUid, const bool force) {
    auto guard = state_.tryBegin("sync " + projectUid);
    if (!guard) return OpResult::fail(BUSY_MESSAGE);

    try {
        const auto report = coordinator_->syncProject(projectUid, force);
        return {report.ok(), report.summary()};
    } catch (const std::exception& e) {
        Registry::siteline()->error("[SyncService] Sync of project {} failed: {}", projectUid, e.what());
        return OpResult::fail(fmt::format("sync failed: {}", e.what()));
    }
}

OpResult SyncService::syncAllProjects() {
    auto guard = state_.tryBegin("sync all");
    if (!guard) return OpResult::fail(BUSY_MESSAGE);

    try {
        const auto report = coordinator_->syncAll();
        return {report.ok(), report.summary()};
    } catch (const std::exception& e) {
        Registry::siteline()->error("[SyncService] Project sync failed: {}", e.what());
        return OpResult::fail(fmt::format("sync failed: {}", e.what()));
    }
}

OpResult SyncService::uploadEvents(const std::vector<std::string>& eventUids, const std::string& targetProjectUid) {
    auto guard = state_.tryBegin("upload " + targetProjectUid);
    if (!guard) return OpResult::fail(BUSY_MESSAGE);
    return runUpload(eventUids, targetProjectUid, upload::Orchestrator::Mode::Batch);
}

OpResult SyncService::uploadEvent(const std::string& eventUid, const std::string& targetProjectUid) {
    auto guard = state_.tryBegin("upload " + eventUid);
    if (!guard) return OpResult::fail(BUSY_MESSAGE);
    return runUpload({eventUid}, targetProjectUid, upload::Orchestrator::Mode::Single);
}

OpResult SyncService::uploadPendingEvents(const std::string& projectUid) {
    auto guard = state_.tryBegin("upload pending " + projectUid);
    if (!guard) return OpResult::fail(BUSY_MESSAGE);

    std::vector<std::string> pending;
    try {
        pending = pendingEvents(projectUid);
    } catch (const std::exception& e) {
        Registry::siteline()->error("[SyncService] Listing pending events of {} failed: {}", projectUid, e.what());
        return OpResult::fail(fmt::format("upload failed: {}", e.what()));
    }

    if (pending.empty()) return OpResult::ok(fmt::format("no pending events for project {}", projectUid));
    return runUpload(pending, projectUid, upload::Orchestrator::Mode::Batch);
}

OpResult SyncService::runUpload(const std::vector<std::string>& eventUids, const std::string& targetProjectUid,
                               const upload::Orchestrator::Mode mode) {
    upload::Orchestrator::Deps orchestratorDeps{deps_.api, deps_.events, packager_, tickets_, progress_, pool_};
    const upload::Orchestrator::Options options{uploadCfg_.batch_poll, uploadCfg_.single_poll};
    const upload::RetryPolicy policy{uploadCfg_.max_attempts, uploadCfg_.retry_delay};

    auto attempt = [&](const std::vector<std::string>& uids) {
        upload::Orchestrator orchestrator(orchestratorDeps, options, deps_.sleeper);
        return orchestrator.run(uids, targetProjectUid, mode);
    };

    auto isSynced = [this](const std::string& uid) { return deps_.events->isSynced(uid); };

    try {
        upload::Retry retry(attempt, policy, progress_, isSynced, deps_.sleeper);
        auto result = retry(eventUids);
        Registry::siteline()->info("[SyncService] Upload to {} {}: {}", targetProjectUid,
                                   result.success ? "succeeded" : "failed", result.message);
        return result;
    } catch (const std::exception& e) {
        progress_->finish();
        Registry::siteline()->error("[SyncService] Upload to {} failed: {}", targetProjectUid, e.what());
        return OpResult::fail(fmt::format("upload failed: {}", e.what()));
    }
}

std::vector<std::string> SyncService::pendingEvents(const std::string& projectUid) const {
    std::vector<std::string> out;
    std::set<std::string> seen;

    for (auto& uid : deps_.events->listUnsynced(projectUid))
        if (seen.insert(uid).second) out.push_back(std::move(uid));

    std::error_code ec;
    if (!fs::is_directory(eventsDir_, ec)) return out;

    std::vector<fs::path> dirs;
    for (const auto& entry : fs::directory_iterator(eventsDir_, ec))
        if (entry.is_directory()) dirs.push_back(entry.path());
    std::ranges::sort(dirs);

    for (const auto& dir : dirs) {
        const auto uid = dir.filename().string();
        if (seen.contains(uid)) continue;

        const auto meta = dir / "meta.json";
        if (!fs::is_regular_file(meta, ec)) continue;

        const auto doc = nlohmann::json::parse(util::readFileToString(meta), nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            Registry::storage()->warn("[SyncService] Ignoring unreadable {}", meta.string());
            continue;
        }

        std::string owner;
        for (const auto* key : {"project_uid", "projectUid"})
            if (doc.contains(key) && doc[key].is_string()) {
                owner = doc[key].get<std::string>();
                break;
            }

        if (owner != projectUid || deps_.events->isSynced(uid)) continue;
        seen.insert(uid);
        out.push_back(uid);
    }

    return out;
}

OpResult SyncService::retryFailedDownloads(const std::string& projectUid) {
    auto guard = state_.tryBegin("retry downloads " + projectUid);
    if (!guard) return OpResult::fail(BUSY_MESSAGE);

    try {
        const auto report = resolver_->retryFailed(projectUid);
        std::string msg = fmt::format("downloaded {}/{} assets", report.succeeded, report.total);
        for (const auto& f : report.failures) msg += "\n" + f;
        return {report.complete(), msg};
    } catch (const std::exception& e) {
        Registry::siteline()->error("[SyncService] Download retry for {} failed: {}", projectUid, e.what());
        return OpResult::fail(fmt::format("download retry failed: {}", e.what()));
    }
}

OpResult SyncService::clearProjectAssets(const std::string& projectUid) {
    auto guard = state_.tryBegin("clear assets " + projectUid);
    if (!guard) return OpResult::fail(BUSY_MESSAGE);

    try {
        const auto evicted = resolver_->clearProject(projectUid);
        return OpResult::ok(fmt::format("released assets of project {}, {} evicted", projectUid, evicted));
    } catch (const std::exception& e) {
        Registry::siteline()->error("[SyncService] Clearing assets of {} failed: {}", projectUid, e.what());
        return OpResult::fail(fmt::format("clear assets failed: {}", e.what()));
    }
}

OpResult SyncService::cleanStorage() {
    auto guard = state_.tryBegin("clean storage");
    if (!guard) return OpResult::fail(BUSY_MESSAGE);

    const auto report = janitor_->sweep();
    return OpResult::ok(fmt::format("removed {} stale files ({} bytes)", report.removed, report.bytes));
}

OpResult SyncService::cleanupProjects(const std::vector<std::string>& projectUids) {
    auto guard = state_.tryBegin("cleanup projects");
    if (!guard) return OpResult::fail(BUSY_MESSAGE);

    unsigned int removed = 0, evicted = 0;
    std::vector<std::string> failures;

    for (const auto& uid : projectUids) {
        try {
            evicted += resolver_->clearProject(uid);

            std::error_code ec;
            fs::remove_all(defectImageDir_ / util::sanitizeFileName(uid), ec);
            if (ec) throw std::runtime_error(fmt::format("removing defect images: {}", ec.message()));

            deps_.projects->deleteProject(uid);
            ++removed;
            Registry::siteline()->info("[SyncService] Removed project {}", uid);
        } catch (const std::exception& e) {
            Registry::siteline()->error("[SyncService] Cleanup of project {} failed: {}", uid, e.what());
            failures.push_back(fmt::format("{}: {}", uid, e.what()));
        }
    }

    std::string msg = fmt::format("removed {}/{} projects, {} assets evicted", removed, projectUids.size(), evicted);
    for (const auto& f : failures) msg += "\n" + f;
    return {failures.empty(), msg};
}

std::optional<fs::path> SyncService::cachedAsset(const std::string& remoteId) {
    try {
        return resolver_->localFile(remoteId);
    } catch (const std::exception& e) {
        Registry::assets()->error("[SyncService] Cache lookup for {} failed: {}", remoteId, e.what());
        return std::nullopt;
    }
}

std::vector<store::AssetStore::NodePtr> SyncService::assets(const std::string& projectUid) const {
    try {
        return resolver_->nodes(projectUid);
    } catch (const std::exception& e) {
        Registry::assets()->error("[SyncService] Listing assets of {} failed: {}", projectUid, e.what());
        return {};
    }
}

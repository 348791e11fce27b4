#pragma once

#include "config/Config.hpp"
#include "sync/ProgressTracker.hpp"
#include "sync/SyncState.hpp"
#include "sync/model/Result.hpp"
#include "sync/store/AssetStore.hpp"
#include "sync/upload/Orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sl::remote { class Api; }
namespace sl::concurrency { class ThreadPool; }
namespace sl::sync::store {
class ProjectStore;
class EventStore;
}
namespace sl::sync::assets { class AssetResolver; }
namespace sl::sync::project { class Coordinator; }
namespace sl::sync::upload {
class EventPackager;
class TicketClient;
}

namespace sl::services {

class StorageJanitor;

// Inbound surface of the engine. Every operation reports (success, message) and never throws.
// Sync and upload jobs are mutually exclusive; a second one is rejected while the first runs.
class SyncService {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Deps {
        std::shared_ptr<remote::Api> api;
        std::shared_ptr<sync::store::ProjectStore> projects;
        std::shared_ptr<sync::store::AssetStore> assets;
        std::shared_ptr<sync::store::EventStore> events;
        Sleeper sleeper;  // optional; retry delays and poll intervals use it when set
    };

    SyncService(Deps deps, const config::Config& cfg);
    ~SyncService();

    sync::model::OpResult syncProject(const std::string& projectUid, bool force = false);
    sync::model::OpResult syncAllProjects();

    sync::model::OpResult uploadEvents(const std::vector<std::string>& eventUids, const std::string& targetProjectUid);
    sync::model::OpResult uploadEvent(const std::string& eventUid, const std::string& targetProjectUid);

    // Events recorded as pending for the project plus local events whose meta.json names it.
    sync::model::OpResult uploadPendingEvents(const std::string& projectUid);

    sync::model::OpResult retryFailedDownloads(const std::string& projectUid);
    sync::model::OpResult clearProjectAssets(const std::string& projectUid);
    sync::model::OpResult cleanStorage();

    // Removes each project locally: releases its assets, deletes its defect images, then drops its rows.
    // Assets still owned by another project stay cached. Captured events are left untouched.
    sync::model::OpResult cleanupProjects(const std::vector<std::string>& projectUids);

    std::optional<std::filesystem::path> cachedAsset(const std::string& remoteId);
    std::vector<sync::store::AssetStore::NodePtr> assets(const std::string& projectUid) const;

    [[nodiscard]] std::shared_ptr<sync::ProgressTracker> progress() const { return progress_; }
    [[nodiscard]] sync::SyncState& state() { return state_; }

    // Throws when the event store cannot be read.
    std::vector<std::string> pendingEvents(const std::string& projectUid) const;

    static constexpr auto BUSY_MESSAGE = "sync already in progress";

private:
    Deps deps_;
    config::UploadConfig uploadCfg_;
    std::filesystem::path eventsDir_;
    std::filesystem::path defectImageDir_;

    sync::SyncState state_;
    std::shared_ptr<sync::ProgressTracker> progress_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    std::shared_ptr<sync::assets::AssetResolver> resolver_;
    std::shared_ptr<sync::project::Coordinator> coordinator_;
    std::shared_ptr<sync::upload::EventPackager> packager_;
    std::shared_ptr<sync::upload::TicketClient> tickets_;
    std::shared_ptr<StorageJanitor> janitor_;

    sync::model::OpResult runUpload(const std::vector<std::string>& eventUids, const std::string& targetProjectUid,
                                    sync::upload::Orchestrator::Mode mode);
};

}

#include "services/SyncScheduler.hpp"
#include "services/SyncService.hpp"
#include "log/Registry.hpp"

using namespace sl::services;
using namespace sl::log;

SyncScheduler::SyncScheduler(std::shared_ptr<SyncService> service, const std::chrono::milliseconds interval)
    : AsyncService("SyncScheduler"), service_(std::move(service)), interval_(interval) {
    if (!service_) throw std::invalid_argument("SyncScheduler requires a sync service");
}

SyncScheduler::~SyncScheduler() { stop(); }

void SyncScheduler::runLoop() {
    while (!shouldStop()) {
        const auto synced = service_->syncAllProjects();
        if (synced) Registry::sync()->info("[SyncScheduler] Scheduled sync finished: {}", synced.message);
        else Registry::sync()->warn("[SyncScheduler] Scheduled sync failed: {}", synced.message);

        const auto cleaned = service_->cleanStorage();
        Registry::storage()->debug("[SyncScheduler] {}", cleaned.message);

        ++passes_;
        lazySleep(interval_);
    }
}

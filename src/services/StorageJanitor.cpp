#include "services/StorageJanitor.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

using namespace sl::services;
using namespace sl::log;
namespace fs = std::filesystem;

StorageJanitor::StorageJanitor(config::StorageConfig cfg) : cfg_(std::move(cfg)) {}

std::chrono::seconds StorageJanitor::maxAge() const {
    return std::chrono::hours(24) * cfg_.cache_max_age_days;
}

SweepReport StorageJanitor::sweep() const {
    SweepReport report;
    sweepDir(cfg_.assetCachePath(), true, report);
    sweepDir(cfg_.defectImagePath(), true, report);
    sweepDir(cfg_.scratchPath(), false, report);

    if (report.removed > 0)
        Registry::storage()->info("[StorageJanitor] Removed {} stale files ({} bytes)", report.removed, report.bytes);
    return report;
}

void StorageJanitor::sweepDir(const fs::path& dir, const bool tmpOnly, SweepReport& report) const {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return;

    const auto age = maxAge();
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        if (!entry.is_regular_file(ec)) {
            ec.clear();
            continue;
        }
        if (tmpOnly && entry.path().extension() != ".tmp") continue;

        if (!util::isOlderThan(entry.path(), age)) continue;
        const auto size = entry.file_size(ec);
        const bool sized = !ec;
        if (util::removeQuietly(entry.path())) {
            ++report.removed;
            if (sized) report.bytes += size;
        }
        ec.clear();
    }

    if (ec) Registry::storage()->warn("[StorageJanitor] Failed to walk {}: {}", dir.string(), ec.message());
}

#include "sync/assets/Downloader.hpp"
#include "sync/store/AssetStore.hpp"
#include "remote/Api.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace sl::sync::assets;
using namespace sl::sync::model;
using namespace sl::log;
namespace fs = std::filesystem;

Downloader::Downloader(std::shared_ptr<remote::Api> api, std::shared_ptr<store::AssetStore> store,
                       fs::path cacheDir)
    : api_(std::move(api)), store_(std::move(store)), cacheDir_(std::move(cacheDir)) {
    if (!api_ || !store_) throw std::invalid_argument("Downloader requires an api and an asset store");
}

fs::path Downloader::targetPath(const std::string& remoteId, const std::optional<std::string>& fileType) const {
    auto name = util::sanitizeFileName(remoteId);
    if (fileType && !fileType->empty()) name += "." + util::sanitizeFileName(*fileType);
    return cacheDir_ / name;
}

void Downloader::markFailed(const AssetNode& node) const {
    try {
        store_->updateStatus(node.node_id, AssetNode::Status::Failed, std::nullopt);
    } catch (const std::exception& e) {
        Registry::assets()->error("[Downloader] Failed to record FAILED state for {}: {}", node.node_id, e.what());
    }
}

OpResult Downloader::download(const AssetNode& node) {
    if (!node.remote_id) return OpResult::fail("folder nodes are never downloaded: " + node.node_id);
    const auto& remoteId = *node.remote_id;

    fs::path tmp;
    try {
        store_->updateStatus(node.node_id, AssetNode::Status::Downloading, std::nullopt);

        const auto resolved = api_->resolveDownloadUrl({remoteId});
        if (resolved.empty()) throw std::runtime_error("no download url returned for " + remoteId);

        const auto it = std::ranges::find_if(resolved, [&](const remote::ResolvedUrl& r) { return r.remote_id == remoteId; });
        const auto& target = it != resolved.end() ? *it : resolved.front();

        auto fileType = node.file_type;
        if (target.file_type && !target.file_type->empty()) {
            fileType = target.file_type;
            if (fileType != node.file_type) store_->updateFileType(node.node_id, *fileType);
        }
        if (!fileType) fileType = util::extensionOf(util::fileNameFromUrl(target.url));

        const auto dest = targetPath(remoteId, fileType);
        tmp = dest;
        tmp += ".tmp";

        fs::create_directories(cacheDir_);
        api_->download(target.url, tmp);
        fs::rename(tmp, dest);

        store_->updateStatus(node.node_id, AssetNode::Status::Completed, dest);
        Registry::assets()->debug("[Downloader] Cached {} at {}", remoteId, dest.string());
        return OpResult::ok(dest.string());
    } catch (const std::exception& e) {
        Registry::assets()->error("[Downloader] Download of {} ({}) failed: {}", remoteId, node.name, e.what());
        if (!tmp.empty()) util::removeQuietly(tmp);
        markFailed(node);
        return OpResult::fail(e.what());
    }
}

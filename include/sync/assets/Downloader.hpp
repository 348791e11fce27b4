#pragma once

#include "sync/model/AssetNode.hpp"
#include "sync/model/Result.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace sl::remote { class Api; }
namespace sl::sync::store { class AssetStore; }

namespace sl::sync::assets {

// Resolves a remote id to a short-lived URL and streams it into the content-addressed cache.
class Downloader {
public:
    Downloader(std::shared_ptr<remote::Api> api, std::shared_ptr<store::AssetStore> store,
               std::filesystem::path cacheDir);

    // PENDING|FAILED|COMPLETED(missing) -> DOWNLOADING -> COMPLETED|FAILED. Never throws.
    model::OpResult download(const model::AssetNode& node);

    // <cacheDir>/<remoteId>[.<fileType>]
    [[nodiscard]] std::filesystem::path targetPath(const std::string& remoteId,
                                                   const std::optional<std::string>& fileType) const;

    [[nodiscard]] const std::filesystem::path& cacheDir() const { return cacheDir_; }

private:
    std::shared_ptr<remote::Api> api_;
    std::shared_ptr<store::AssetStore> store_;
    std::filesystem::path cacheDir_;

    void markFailed(const model::AssetNode& node) const;
};

}

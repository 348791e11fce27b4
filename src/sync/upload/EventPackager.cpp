#include "sync/upload/EventPackager.hpp"
#include "crypto/Hash.hpp"
#include "util/ZipWriter.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <vector>

using namespace sl::sync::upload;
using namespace sl::sync::model;
using namespace sl::log;
using json = nlohmann::json;
namespace fs = std::filesystem;

static constexpr std::string_view kLegacySuffix = ".$ext";

EventPackager::EventPackager(fs::path eventsDir, fs::path scratchDir)
    : eventsDir_(std::move(eventsDir)), scratchDir_(std::move(scratchDir)) {}

unsigned int EventPackager::normalizeLegacyAudio(const fs::path& eventDir) {
    const auto metaPath = eventDir / "meta.json";
    if (!fs::exists(metaPath)) return 0;

    auto meta = json::parse(util::readFileToString(metaPath));
    if (!meta.is_object() || !meta.contains("audios") || !meta["audios"].is_array()) return 0;

    unsigned int renamed = 0;
    json updated = json::array();

    for (const auto& entry : meta["audios"]) {
        if (!entry.is_string() || !entry.get<std::string>().ends_with(kLegacySuffix)) {
            updated.push_back(entry);
            continue;
        }

        const auto name = entry.get<std::string>();
        const auto base = name.substr(0, name.size() - kLegacySuffix.size());

        auto newName = base + ".m4a";
        for (unsigned int attempt = 1; fs::exists(eventDir / newName); ++attempt)
            newName = fmt::format("{}_{}.m4a", base, attempt);

        if (fs::exists(eventDir / name)) fs::rename(eventDir / name, eventDir / newName);

        updated.push_back(newName);
        ++renamed;
    }

    if (renamed) {
        meta["audios"] = updated;
        util::writeFileAtomically(metaPath, meta.dump());
        Registry::upload()->info("[EventPackager] Renamed {} legacy audio files in {}", renamed, eventDir.string());
    }

    return renamed;
}

void EventPackager::writeArchive(const fs::path& sourceDir, const fs::path& archive) {
    std::vector<std::pair<std::string, fs::path>> entries;
    for (const auto& e : fs::recursive_directory_iterator(sourceDir)) {
        if (!e.is_regular_file()) continue;
        entries.emplace_back(fs::relative(e.path(), sourceDir).generic_string(), e.path());
    }
    std::ranges::sort(entries, {}, &std::pair<std::string, fs::path>::first);

    util::ZipWriter zip(archive);
    if (entries.empty()) zip.addBytes(EMPTY_ENTRY_NAME, EMPTY_ENTRY_TEXT);
    for (const auto& [name, path] : entries) zip.addFile(name, path);
    zip.close();
}

PackResult EventPackager::pack(const std::string& eventUid) const {
    PackResult result;

    const auto dir = eventDir(eventUid);
    std::error_code ec;
    if (eventUid.empty() || !fs::is_directory(dir, ec)) {
        result.failure = ItemResult::Kind::NotFound;
        result.message = "event not found locally";
        Registry::upload()->warn("[EventPackager] Event {} not found at {}", eventUid, dir.string());
        return result;
    }

    try {
        normalizeLegacyAudio(dir);
    } catch (const std::exception& e) {
        Registry::upload()->warn("[EventPackager] Legacy audio fix failed for {}: {}", eventUid, e.what());
    }

    const auto archiveName = eventUid + ".zip";
    const auto finalPath = scratchDir_ / archiveName;
    auto tmpPath = finalPath;
    tmpPath += ".tmp";

    try {
        fs::create_directories(scratchDir_);
        writeArchive(dir, tmpPath);
        fs::rename(tmpPath, finalPath);

        UploadPackage pkg;
        pkg.event_uid = eventUid;
        pkg.archive_name = archiveName;
        pkg.archive_path = finalPath;
        pkg.package_digest = crypto::hash::sha256(finalPath);

        Registry::upload()->debug("[EventPackager] Packed {} ({} bytes, sha256 {})",
                                  eventUid, fs::file_size(finalPath), pkg.package_digest);
        result.package = std::move(pkg);
    } catch (const std::exception& e) {
        Registry::upload()->error("[EventPackager] Packaging {} failed: {}", eventUid, e.what());
        util::removeQuietly(tmpPath);
        util::removeQuietly(finalPath);
        result.failure = ItemResult::Kind::PackagingFailed;
        result.message = fmt::format("packaging failed: {}", e.what());
    }

    return result;
}

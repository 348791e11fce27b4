#pragma once

#include "sync/model/Upload.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace sl::sync::upload {

struct PackResult {
    std::optional<model::UploadPackage> package;
    model::ItemResult::Kind failure{model::ItemResult::Kind::PackagingFailed};
    std::string message;

    [[nodiscard]] bool ok() const { return package.has_value(); }
};

// Archives a local event directory into a ZIP and digests it (SHA-256, lowercase hex).
class EventPackager {
public:
    EventPackager(std::filesystem::path eventsDir, std::filesystem::path scratchDir);

    // Never throws. A missing event directory yields Kind::NotFound.
    PackResult pack(const std::string& eventUid) const;

    [[nodiscard]] std::filesystem::path eventDir(const std::string& eventUid) const { return eventsDir_ / eventUid; }

    // Renames audio files recorded with the literal ".$ext" suffix to ".m4a" and rewrites meta.json.
    // Returns the number of entries renamed.
    static unsigned int normalizeLegacyAudio(const std::filesystem::path& eventDir);

    // Sorted relative entries; an empty tree yields a single empty.txt.
    static void writeArchive(const std::filesystem::path& sourceDir, const std::filesystem::path& archive);

    static constexpr auto EMPTY_ENTRY_NAME = "empty.txt";
    static constexpr auto EMPTY_ENTRY_TEXT = "This directory was empty during compression.";

private:
    std::filesystem::path eventsDir_, scratchDir_;
};

}

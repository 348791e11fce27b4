#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace sl::sync::model {

struct UploadPackage {
    std::string event_uid;
    std::string package_digest;  // SHA-256 hex of the archive
    std::string archive_name;
    std::filesystem::path archive_path;
};

// One-time direct-upload destination issued by the server.
struct UploadTicket {
    std::string host, directory, object_id, policy, signature, access_id;

    [[nodiscard]] std::string objectKey() const { return directory + object_id; }
    [[nodiscard]] std::string uploadUrl() const;
};

struct UploadTask {
    std::string task_uid;
    std::string target_project_uid;
    std::vector<UploadPackage> packages;
    std::map<std::string, UploadTicket> tickets_by_digest;
    std::set<std::string> completed_digests;
};

// Per-event line of a batch report.
struct ItemResult {
    enum class Kind { Uploaded, NotFound, PackagingFailed, Unmatched, UploadFailed };

    std::string event_uid;
    Kind kind{Kind::UploadFailed};
    std::string message;

    [[nodiscard]] bool ok() const { return kind == Kind::Uploaded; }
    [[nodiscard]] bool retryable() const { return kind != Kind::Uploaded && kind != Kind::NotFound; }
    [[nodiscard]] std::string reportLine() const;
};

struct BatchResult {
    enum class Outcome { Succeeded, TimedOut, Failed };

    Outcome outcome{Outcome::Failed};
    std::string task_uid;
    std::string message;
    std::vector<ItemResult> items;

    [[nodiscard]] bool ok() const;
    [[nodiscard]] bool retryable() const;
    [[nodiscard]] unsigned int uploadedCount() const;
    [[nodiscard]] std::string report() const;
};

std::string to_string(const BatchResult::Outcome& outcome);

}

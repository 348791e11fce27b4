#pragma once

#include "sync/model/Project.hpp"
#include "sync/model/Upload.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sl::remote {

class ApiError : public std::runtime_error {
public:
    ApiError(const std::string& what, const long httpStatus)
        : std::runtime_error(what), httpStatus_(httpStatus) {}

    [[nodiscard]] long httpStatus() const { return httpStatus_; }

private:
    long httpStatus_;
};

struct ResolvedUrl {
    std::string remote_id;
    std::string url;
    std::optional<std::string> file_type, file_name;
};

// One entry of the create-upload-task response, echoed back with the digest it was issued for.
struct TicketEntry {
    std::string digest;
    std::string event_uid;
    std::string package_name;
    sync::model::UploadTicket ticket;
};

// Outbound surface of the remote service. Every call blocks on network I/O and throws
// (ApiError or std::runtime_error) on transport or HTTP failure.
class Api {
public:
    virtual ~Api() = default;

    virtual std::vector<sync::model::Project> listProjects() = 0;
    virtual nlohmann::json getProjectDetail(const std::string& projectUid) = 0;
    virtual std::vector<ResolvedUrl> resolveDownloadUrl(const std::vector<std::string>& remoteIds) = 0;
    virtual void download(const std::string& url, const std::filesystem::path& dest) = 0;

    virtual sync::model::UploadTicket requestUploadTicket(const std::string& fileName, const std::string& digest) = 0;
    virtual std::vector<TicketEntry> createUploadTask(const sync::model::UploadTask& task) = 0;
    virtual void directUpload(const sync::model::UploadTicket& ticket, const std::filesystem::path& archive) = 0;
    virtual bool pollTaskStatus(const std::string& taskUid) = 0;
};

}

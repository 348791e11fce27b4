#pragma once

#include "remote/Api.hpp"
#include "config/Config.hpp"
#include "util/curlWrappers.hpp"

#include <string>
#include <utility>
#include <vector>

namespace sl::remote {

// libcurl implementation of the remote service surface.
class HttpApi final : public Api {
public:
    explicit HttpApi(config::ApiConfig cfg);

    std::vector<sync::model::Project> listProjects() override;
    nlohmann::json getProjectDetail(const std::string& projectUid) override;
    std::vector<ResolvedUrl> resolveDownloadUrl(const std::vector<std::string>& remoteIds) override;
    void download(const std::string& url, const std::filesystem::path& dest) override;

    sync::model::UploadTicket requestUploadTicket(const std::string& fileName, const std::string& digest) override;
    std::vector<TicketEntry> createUploadTask(const sync::model::UploadTask& task) override;
    void directUpload(const sync::model::UploadTicket& ticket, const std::filesystem::path& archive) override;
    bool pollTaskStatus(const std::string& taskUid) override;

private:
    config::ApiConfig cfg_;

    using Query = std::vector<std::pair<std::string, std::string>>;

    [[nodiscard]] std::string url(const std::string& endpoint, const Query& query = {}) const;
    [[nodiscard]] util::SList headers(bool jsonBody) const;
    void applyTimeouts(CURL* h, unsigned int totalSeconds) const;

    util::HttpResponse get(const std::string& endpoint, const Query& query = {}) const;
    util::HttpResponse postJson(const std::string& endpoint, const nlohmann::json& body) const;

    static nlohmann::json parseBody(const util::HttpResponse& resp, const std::string& what);
    static void check(const util::HttpResponse& resp, const std::string& what);
};

}

#include "remote/HttpApi.hpp"
#include "remote/parse.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <fstream>

using namespace sl::remote;
using namespace sl::sync::model;
using namespace sl::util;
using namespace sl::log;
using json = nlohmann::json;

static std::string escape(const std::string& s) {
    CurlEasy h;
    char* out = curl_easy_escape(h, s.c_str(), static_cast<int>(s.size()));
    if (!out) throw std::runtime_error("curl_easy_escape failed");
    std::string escaped(out);
    curl_free(out);
    return escaped;
}

HttpApi::HttpApi(config::ApiConfig cfg) : cfg_(std::move(cfg)) {
    ensureCurlGlobalInit();
}

std::string HttpApi::url(const std::string& endpoint, const Query& query) const {
    std::string u = cfg_.base_url;
    if (!u.empty() && u.back() != '/' && !endpoint.starts_with('/')) u += '/';
    if (!u.empty() && u.back() == '/' && endpoint.starts_with('/')) u.pop_back();
    u += endpoint;

    char sep = u.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [k, v] : query) {
        u += sep + k + '=' + escape(v);
        sep = '&';
    }
    return u;
}

SList HttpApi::headers(const bool jsonBody) const {
    SList hdrs;
    hdrs.add("Accept: application/json");
    if (jsonBody) hdrs.add("Content-Type: application/json");
    if (!cfg_.username.empty()) hdrs.add("X-USERNAME: " + cfg_.username);
    if (!cfg_.token.empty()) hdrs.add("Authorization: Bearer " + cfg_.token);
    return hdrs;
}

void HttpApi::applyTimeouts(CURL* h, const unsigned int totalSeconds) const {
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout_seconds));
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(totalSeconds));
}

HttpResponse HttpApi::get(const std::string& endpoint, const Query& query) const {
    const auto target = url(endpoint, query);
    const auto hdrs = headers(false);

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, target.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        applyTimeouts(h, cfg_.request_timeout_seconds);
    });
}

HttpResponse HttpApi::postJson(const std::string& endpoint, const json& body) const {
    const auto target = url(endpoint);
    const auto hdrs = headers(true);
    const auto payload = body.dump();

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, target.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        applyTimeouts(h, cfg_.request_timeout_seconds);
    });
}

void HttpApi::check(const HttpResponse& resp, const std::string& what) {
    if (resp.ok()) return;

    Registry::http()->error("[HttpApi] {} failed: CURL={} HTTP={} Response:\n{}",
                            what, static_cast<int>(resp.curl), resp.http, resp.body);

    if (resp.curl != CURLE_OK)
        throw ApiError(fmt::format("{} failed: {}", what, resp.error), resp.http);
    throw ApiError(fmt::format("{} failed (HTTP {}): {}", what, resp.http, resp.body), resp.http);
}

json HttpApi::parseBody(const HttpResponse& resp, const std::string& what) {
    check(resp, what);
    auto body = json::parse(resp.body, nullptr, false);
    if (body.is_discarded()) throw std::runtime_error(what + " returned a non-JSON body");
    return body;
}

std::vector<Project> HttpApi::listProjects() {
    return parse::projectList(parseBody(get(cfg_.endpoints.project_list), "listProjects"));
}

json HttpApi::getProjectDetail(const std::string& projectUid) {
    const auto body = parseBody(get(cfg_.endpoints.project_detail, {{"project_uid", projectUid}}),
                                "getProjectDetail(" + projectUid + ")");
    return parse::unwrapDetail(body);
}

std::vector<ResolvedUrl> HttpApi::resolveDownloadUrl(const std::vector<std::string>& remoteIds) {
    const auto resp = postJson(cfg_.endpoints.download_url, json(remoteIds));
    check(resp, "resolveDownloadUrl");
    return parse::resolvedUrls(resp.body, remoteIds);
}

void HttpApi::download(const std::string& url, const std::filesystem::path& dest) {
    std::ofstream file(dest, std::ios::binary | std::ios::trunc);
    if (!file) throw std::runtime_error("Failed to open output file for download: " + dest.string());

    auto writeFn = +[](const char* ptr, const size_t size, const size_t nmemb, void* userdata) -> size_t {
        auto* fout = static_cast<std::ofstream*>(userdata);
        fout->write(ptr, static_cast<std::streamsize>(size * nmemb));
        return fout->good() ? size * nmemb : 0;
    };

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeFn);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &file);
        applyTimeouts(h, cfg_.transfer_timeout_seconds);
    });

    file.close();
    check(resp, "download");
    if (!file) throw std::runtime_error("Failed to write download to " + dest.string());
}

UploadTicket HttpApi::requestUploadTicket(const std::string& fileName, const std::string& digest) {
    const auto body = parseBody(get(cfg_.endpoints.upload_ticket,
                                    {{"file_name", fileName}, {"type", "event_package"}, {"hash", digest}}),
                                "requestUploadTicket(" + fileName + ")");

    const auto& data = body.contains("data") && body["data"].is_object() ? body["data"] : body;
    return parse::ticket(data);
}

std::vector<TicketEntry> HttpApi::createUploadTask(const UploadTask& task) {
    json uploadList = json::array();
    for (const auto& pkg : task.packages)
        uploadList.push_back({
            {"event_uid", pkg.event_uid},
            {"event_package_hash", pkg.package_digest},
            {"event_package_name", pkg.archive_name}
        });

    const json body = {
        {"task_uid", task.task_uid},
        {"target_project_uid", task.target_project_uid},
        {"upload_list", uploadList}
    };

    return parse::uploadTaskResponse(parseBody(postJson(cfg_.endpoints.create_event_upload, body),
                                               "createUploadTask(" + task.task_uid + ")"));
}

void HttpApi::directUpload(const UploadTicket& ticket, const std::filesystem::path& archive) {
    const auto target = ticket.uploadUrl();
    const auto key = ticket.objectKey();

    CurlEasy h;
    Mime form(h);
    form.addField("key", key);
    form.addField("policy", ticket.policy);
    form.addField("OSSAccessKeyId", ticket.access_id);
    form.addField("signature", ticket.signature);
    form.addField("success_action_status", "200");
    form.addFile("file", archive.string(), archive.filename().string(), "application/zip");

    std::string body;
    curl_easy_setopt(h, CURLOPT_URL, target.c_str());
    curl_easy_setopt(h, CURLOPT_MIMEPOST, form.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    applyTimeouts(h, cfg_.transfer_timeout_seconds);

    HttpResponse resp;
    resp.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.http);
    resp.body.swap(body);
    resp.error = curl_easy_strerror(resp.curl);

    check(resp, "directUpload(" + key + ")");
}

bool HttpApi::pollTaskStatus(const std::string& taskUid) {
    return parse::taskComplete(parseBody(get(cfg_.endpoints.notice_event_upload, {{"task_uid", taskUid}}),
                                         "pollTaskStatus(" + taskUid + ")"));
}

#include "remote/parse.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

using json = nlohmann::json;
using namespace sl::sync::model;

namespace sl::remote::parse {

static const json* find(const json& obj, const std::string_view key) {
    if (!obj.is_object()) return nullptr;
    const auto it = obj.find(std::string(key));
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

static bool allDigits(const std::string& s) {
    return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) { return std::isdigit(c); });
}

// Digit strings longer than 18 characters may not fit in int64_t and are treated as absent.
static std::optional<int64_t> digitsToInt(const std::string& s) {
    if (!allDigits(s) || s.size() > 18) return std::nullopt;
    return std::stoll(s);
}

static unsigned int toCount(const std::optional<int64_t>& v) {
    if (!v || *v <= 0) return 0;
    return static_cast<unsigned int>(std::min<int64_t>(*v, std::numeric_limits<unsigned int>::max()));
}

std::optional<std::string> firstString(const json& obj, const std::initializer_list<std::string_view> keys) {
    for (const auto key : keys) {
        const auto* v = find(obj, key);
        if (!v) continue;
        if (v->is_string()) {
            auto s = v->get<std::string>();
            if (!s.empty()) return s;
        } else if (v->is_number()) {
            return v->dump();
        }
    }
    return std::nullopt;
}

std::optional<int64_t> firstNumber(const json& obj, const std::initializer_list<std::string_view> keys) {
    for (const auto key : keys) {
        const auto* v = find(obj, key);
        if (!v) continue;
        if (v->is_number_integer()) return v->get<int64_t>();
        if (v->is_number_float()) return static_cast<int64_t>(v->get<double>());
        if (v->is_string())
            if (const auto n = digitsToInt(v->get<std::string>())) return n;
    }
    return std::nullopt;
}

std::optional<int64_t> epochMillis(const std::string& text) {
    std::string trimmed = text;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    trimmed.erase(trimmed.find_last_not_of(" \t") + 1);
    if (trimmed.empty()) return std::nullopt;
    if (allDigits(trimmed)) return digitsToInt(trimmed);

    static constexpr std::array formats = {
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S",
        "%Y/%m/%d %H:%M:%S",
        "%Y-%m-%d %H:%M",
        "%Y/%m/%d %H:%M",
        "%Y-%m-%d",
        "%Y/%m/%d",
    };

    for (const auto* fmt : formats) {
        std::tm tm{};
        std::istringstream ss(trimmed);
        ss >> std::get_time(&tm, fmt);
        if (ss.fail()) continue;
        return static_cast<int64_t>(timegm(&tm)) * 1000;
    }
    return std::nullopt;
}

std::optional<Project> project(const json& obj) {
    if (!obj.is_object()) return std::nullopt;

    const auto uid = firstString(obj, {"project_uid", "projectUid", "uid", "projectUID"});
    if (!uid) return std::nullopt;

    Project p;
    p.uid = *uid;
    p.content_hash = firstString(obj, {"project_hash", "projectHash", "hash", "project_hash_value"}).value_or("");
    p.name = firstString(obj, {"name", "projectName", "project_name"}).value_or("Unnamed Project");
    p.status = firstString(obj, {"status", "project_status"}).value_or("ACTIVE");
    p.defect_count = toCount(firstNumber(obj, {"defectCount", "defect_count"}));
    p.event_count = toCount(firstNumber(obj, {"eventCount", "event_count"}));

    static constexpr std::string_view updateKeys[] = {
        "project_last_update_at", "projectLastUpdateAt", "last_update_at", "lastUpdateAt", "updated_at", "updatedAt",
        "endDate", "end_date"
    };
    for (const auto key : updateKeys) {
        const auto* v = find(obj, key);
        if (!v) continue;
        if (v->is_number()) p.last_update_at = v->get<int64_t>();
        else if (v->is_string()) p.last_update_at = epochMillis(v->get<std::string>());
        if (p.last_update_at) break;
    }

    return p;
}

static const json* projectArray(const json& body) {
    if (body.is_array()) return &body;
    for (const auto* key : {"data", "items", "list"}) {
        const auto* top = find(body, key);
        if (!top) continue;
        if (top->is_array()) return top;
        if (top->is_object()) {
            for (const auto* inner : {"data", "items", "list"}) {
                const auto* arr = find(*top, inner);
                if (arr && arr->is_array()) return arr;
            }
        }
        return nullptr;
    }
    return nullptr;
}

std::vector<Project> projectList(const json& body) {
    std::vector<Project> projects;
    const auto* arr = projectArray(body);
    if (!arr) return projects;

    for (const auto& entry : *arr) {
        if (auto p = project(entry)) projects.push_back(std::move(*p));
        else log::Registry::sync()->warn("[parse] Skipping project entry without uid: {}", entry.dump());
    }
    return projects;
}

json unwrapDetail(const json& body) {
    if (body.is_array()) return body.empty() ? json::object() : body.front();
    for (const auto* key : {"data", "item", "project"}) {
        const auto* inner = find(body, key);
        if (inner && inner->is_object()) return *inner;
        if (inner && inner->is_array() && !inner->empty() && inner->front().is_object()) return inner->front();
    }
    return body;
}

static void collectUrls(const json& arr, const std::vector<std::string>& requested, std::vector<ResolvedUrl>& out) {
    for (size_t i = 0; i < arr.size(); ++i) {
        const auto& item = arr[i];
        std::optional<std::string> url;
        ResolvedUrl r;
        if (item.is_string()) url = item.get<std::string>();
        else if (item.is_object()) {
            url = firstString(item, {"url", "download_url"});
            r.file_type = firstString(item, {"file_type"});
            r.file_name = firstString(item, {"file_name"});
            if (auto id = firstString(item, {"file_id", "id"})) r.remote_id = *id;
        }
        if (!url) continue;
        r.url = *url;
        if (r.remote_id.empty() && i < requested.size()) r.remote_id = requested[i];
        out.push_back(std::move(r));
    }
}

std::vector<ResolvedUrl> resolvedUrls(const json& body, const std::vector<std::string>& requested) {
    std::vector<ResolvedUrl> out;

    if (const auto* data = find(body, "data"); data && data->is_array() && !data->empty()) {
        collectUrls(*data, requested, out);
        if (!out.empty()) return out;
    }

    if (const auto* data = find(body, "data"); data && data->is_object()) {
        if (const auto* urls = find(*data, "urls"); urls && urls->is_array()) {
            collectUrls(*urls, requested, out);
            if (!out.empty()) return out;
        }
    }

    if (const auto* urls = find(body, "urls"); urls && urls->is_array()) {
        collectUrls(*urls, requested, out);
        if (!out.empty()) return out;
    }

    const auto* data = find(body, "data");
    const json& direct = data && data->is_object() ? *data : body;
    if (auto url = firstString(direct, {"url", "download_url"})) {
        ResolvedUrl r;
        r.url = *url;
        r.file_type = firstString(direct, {"file_type"});
        r.file_name = firstString(direct, {"file_name"});
        if (!requested.empty()) r.remote_id = requested.front();
        out.push_back(std::move(r));
    }

    return out;
}

std::vector<ResolvedUrl> resolvedUrls(const std::string& rawBody, const std::vector<std::string>& requested) {
    std::string trimmed = rawBody;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n\""));
    trimmed.erase(trimmed.find_last_not_of(" \t\r\n\"") + 1);

    if (trimmed.starts_with("http")) {
        ResolvedUrl r;
        r.url = trimmed;
        if (!requested.empty()) r.remote_id = requested.front();
        return {r};
    }

    const auto body = json::parse(rawBody, nullptr, false);
    if (body.is_discarded()) return {};
    return resolvedUrls(body, requested);
}

UploadTicket ticket(const json& obj) {
    UploadTicket t;
    t.host = firstString(obj, {"host"}).value_or("");
    t.directory = firstString(obj, {"dir"}).value_or("");
    t.object_id = firstString(obj, {"file_id"}).value_or("");
    t.policy = firstString(obj, {"policy"}).value_or("");
    t.signature = firstString(obj, {"signature"}).value_or("");
    t.access_id = firstString(obj, {"accessid"}).value_or("");
    return t;
}

std::vector<TicketEntry> uploadTaskResponse(const json& body) {
    if (const auto* success = find(body, "success"); success && success->is_boolean() && !success->get<bool>())
        throw std::runtime_error("create upload task rejected: " + firstString(body, {"message"}).value_or("no message"));

    std::vector<TicketEntry> entries;
    const auto* data = find(body, "data");
    if (!data || !data->is_array()) return entries;

    for (const auto& item : *data) {
        if (!item.is_object()) continue;
        TicketEntry e;
        e.digest = firstString(item, {"event_package_hash"}).value_or("");
        e.event_uid = firstString(item, {"event_uid"}).value_or("");
        e.package_name = firstString(item, {"event_package_name"}).value_or("");
        if (const auto* t = find(item, "ticket"); t && t->is_object()) e.ticket = ticket(*t);
        entries.push_back(std::move(e));
    }
    return entries;
}

bool taskComplete(const json& body) {
    const auto* success = find(body, "success");
    return success && success->is_boolean() && success->get<bool>();
}

}

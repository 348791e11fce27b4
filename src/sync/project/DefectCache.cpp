#include "sync/project/DefectCache.hpp"
#include "sync/store/ProjectStore.hpp"
#include "remote/Api.hpp"
#include "remote/parse.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace sl::sync::project;
using namespace sl::sync::model;
using namespace sl::log;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const json* defectList(const json& detail) {
    if (!detail.is_object()) return nullptr;
    if (const auto it = detail.find("history_defect_list"); it != detail.end() && it->is_array()) return &*it;
    for (const auto* wrapper : {"data", "item", "result"}) {
        const auto w = detail.find(wrapper);
        if (w == detail.end() || !w->is_object()) continue;
        if (const auto it = w->find("history_defect_list"); it != w->end() && it->is_array()) return &*it;
    }
    return nullptr;
}

}

DefectCache::DefectCache(std::shared_ptr<remote::Api> api, std::shared_ptr<store::ProjectStore> store,
                         fs::path imageDir)
    : api_(std::move(api)), store_(std::move(store)), imageDir_(std::move(imageDir)) {}

std::vector<std::string> DefectCache::pictureIds(const json& pics) {
    std::vector<std::string> ids;

    if (pics.is_string()) {
        std::vector<std::string> parts;
        boost::split(parts, pics.get<std::string>(), boost::is_any_of(","));
        for (auto& p : parts) {
            boost::trim(p);
            if (!p.empty()) ids.push_back(std::move(p));
        }
    } else if (pics.is_array()) {
        for (const auto& item : pics) {
            if (item.is_string() && !item.get<std::string>().empty()) ids.push_back(item.get<std::string>());
            else if (item.is_object())
                if (auto id = remote::parse::firstString(item, {"id", "file_id"})) ids.push_back(*id);
        }
    }

    return ids;
}

std::vector<Defect> DefectCache::parse(const std::string& projectUid, const json& detail) {
    std::vector<Defect> defects;
    const auto* list = defectList(detail);
    if (!list) return defects;

    for (const auto& entry : *list) {
        const auto no = remote::parse::firstString(entry, {"no"});
        if (!no) continue;

        Defect d;
        d.project_uid = projectUid;
        d.defect_no = *no;
        d.risk_rating = remote::parse::firstString(entry, {"risk_rating"}).value_or("");
        d.status = remote::parse::firstString(entry, {"status"}).value_or("OPEN");
        defects.push_back(std::move(d));
    }
    return defects;
}

std::vector<std::string> DefectCache::fetchImages(const std::string& projectUid, const std::string& defectNo,
                                                  const std::vector<std::string>& ids) const {
    std::vector<std::string> paths;
    if (ids.empty()) return paths;

    std::vector<remote::ResolvedUrl> urls;
    try {
        urls = api_->resolveDownloadUrl(ids);
    } catch (const std::exception& e) {
        Registry::sync()->warn("[DefectCache] Could not resolve pictures of defect {} in {}: {}",
                               defectNo, projectUid, e.what());
        return paths;
    }

    const auto dir = imageDir_ / util::sanitizeFileName(projectUid) / util::sanitizeFileName(defectNo);

    for (size_t i = 0; i < urls.size(); ++i) {
        auto name = util::sanitizeFileName(util::fileNameFromUrl(urls[i].url));
        if (name.empty() || name == "_") name = fmt::format("img_{}.jpg", i);
        const auto dest = dir / name;

        try {
            fs::create_directories(dir);
            if (!fs::exists(dest)) {
                auto tmp = dest;
                tmp += ".tmp";
                try {
                    api_->download(urls[i].url, tmp);
                    fs::rename(tmp, dest);
                } catch (...) {
                    util::removeQuietly(tmp);
                    throw;
                }
            }
            paths.push_back(dest.string());
        } catch (const std::exception& e) {
            Registry::sync()->warn("[DefectCache] Picture {} of defect {} failed: {}", i, defectNo, e.what());
        }
    }

    return paths;
}

unsigned int DefectCache::cache(const std::string& projectUid, const json& detail) {
    auto defects = parse(projectUid, detail);
    if (defects.empty()) return 0;

    const auto* list = defectList(detail);
    for (auto& d : defects) {
        for (const auto& entry : *list) {
            if (remote::parse::firstString(entry, {"no"}) != d.defect_no) continue;
            if (const auto pics = entry.find("defect_pics"); pics != entry.end())
                d.images = fetchImages(projectUid, d.defect_no, pictureIds(*pics));
            break;
        }
    }

    store_->upsertDefects(projectUid, defects);
    Registry::sync()->debug("[DefectCache] Stored {} defects for {}", defects.size(), projectUid);
    return static_cast<unsigned int>(defects.size());
}

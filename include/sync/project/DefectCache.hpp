#pragma once

#include "sync/model/Project.hpp"

#include <filesystem>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace sl::remote { class Api; }
namespace sl::sync::store { class ProjectStore; }

namespace sl::sync::project {

// Caches a project's history defects and their pictures. Image failures never fail the project.
class DefectCache {
public:
    DefectCache(std::shared_ptr<remote::Api> api, std::shared_ptr<store::ProjectStore> store,
                std::filesystem::path imageDir);

    // Returns the number of defects stored.
    unsigned int cache(const std::string& projectUid, const nlohmann::json& detail);

    // Defects of the detail payload without images.
    static std::vector<model::Defect> parse(const std::string& projectUid, const nlohmann::json& detail);

    // Picture ids from a CSV string, an array of strings or an array of {id} objects.
    static std::vector<std::string> pictureIds(const nlohmann::json& pics);

private:
    std::shared_ptr<remote::Api> api_;
    std::shared_ptr<store::ProjectStore> store_;
    std::filesystem::path imageDir_;

    std::vector<std::string> fetchImages(const std::string& projectUid, const std::string& defectNo,
                                         const std::vector<std::string>& ids) const;
};

}

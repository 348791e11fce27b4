#pragma once

#include "sync/model/Project.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sl::sync::store {

// Hash store plus the project rows it guards.
class ProjectStore {
public:
    virtual ~ProjectStore() = default;

    virtual std::optional<model::ProjectSyncRecord> getRecord(const std::string& projectUid) = 0;

    // Inserts with an empty hash or refreshes basic fields; never touches the stored hash.
    virtual void upsertProject(const model::Project& project) = 0;

    virtual void updateCounters(const std::string& projectUid, unsigned int defectCount, unsigned int eventCount) = 0;

    virtual void commitHash(const std::string& projectUid, const std::string& contentHash) = 0;

    virtual void saveDetail(const std::string& projectUid, const std::string& rawJson) = 0;

    virtual void upsertDefects(const std::string& projectUid, const std::vector<model::Defect>& defects) = 0;

    // Drops the project row together with its detail and defects. Unknown uids are a no-op.
    virtual void deleteProject(const std::string& projectUid) = 0;
};

}

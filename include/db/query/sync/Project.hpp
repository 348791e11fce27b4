#pragma once

#include "sync/store/ProjectStore.hpp"

namespace sl::db::query::sync {

class Project final : public sl::sync::store::ProjectStore {
    using P = sl::sync::model::Project;
    using Record = sl::sync::model::ProjectSyncRecord;

public:
    std::optional<Record> getRecord(const std::string& projectUid) override;
    void upsertProject(const P& project) override;
    void updateCounters(const std::string& projectUid, unsigned int defectCount, unsigned int eventCount) override;
    void commitHash(const std::string& projectUid, const std::string& contentHash) override;
    void saveDetail(const std::string& projectUid, const std::string& rawJson) override;
    void upsertDefects(const std::string& projectUid, const std::vector<sl::sync::model::Defect>& defects) override;
    void deleteProject(const std::string& projectUid) override;
};

}

#include "db/query/sync/Project.hpp"
#include "db/Transactions.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

using namespace sl::db::query::sync;
using namespace sl::sync::model;

std::optional<ProjectSyncRecord> Project::getRecord(const std::string& projectUid) {
    return Transactions::exec("Project::getRecord", [&](pqxx::work& txn) -> std::optional<ProjectSyncRecord> {
        const auto res = txn.exec(pqxx::prepped{"get_project_sync_record"}, pqxx::params{projectUid});
        if (res.empty()) return std::nullopt;
        return ProjectSyncRecord(res.one_row());
    });
}

void Project::upsertProject(const P& project) {
    Transactions::exec("Project::upsertProject", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(project.uid);
        p.append(project.name);
        p.append(project.status);
        p.append(static_cast<int>(project.defect_count));
        p.append(static_cast<int>(project.event_count));
        p.append(project.last_update_at);

        txn.exec(pqxx::prepped{"upsert_project"}, p);
    });
}

void Project::updateCounters(const std::string& projectUid, const unsigned int defectCount, const unsigned int eventCount) {
    Transactions::exec("Project::updateCounters", [&](pqxx::work& txn) {
        pqxx::params p{projectUid, static_cast<int>(defectCount), static_cast<int>(eventCount)};
        txn.exec(pqxx::prepped{"update_project_counters"}, p);
    });
}

void Project::commitHash(const std::string& projectUid, const std::string& contentHash) {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    Transactions::exec("Project::commitHash", [&](pqxx::work& txn) {
        pqxx::params p{projectUid, contentHash, static_cast<int64_t>(now)};
        txn.exec(pqxx::prepped{"commit_project_hash"}, p);
    });
}

void Project::saveDetail(const std::string& projectUid, const std::string& rawJson) {
    Transactions::exec("Project::saveDetail", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"upsert_project_detail"}, pqxx::params{projectUid, rawJson});
    });
}

void Project::upsertDefects(const std::string& projectUid, const std::vector<Defect>& defects) {
    Transactions::exec("Project::upsertDefects", [&](pqxx::work& txn) {
        for (const auto& d : defects) {
            pqxx::params p;
            p.append(projectUid);
            p.append(d.defect_no);
            p.append(d.risk_rating);
            p.append(d.status);
            p.append(nlohmann::json(d.images).dump());

            txn.exec(pqxx::prepped{"upsert_defect"}, p);
        }
    });
}

void Project::deleteProject(const std::string& projectUid) {
    Transactions::exec("Project::deleteProject", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_project"}, pqxx::params{projectUid});
    });
}

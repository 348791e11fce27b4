#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pqxx {
class row;
}

namespace sl::sync::model {

// Hash store row: the last content hash committed for a remote project.
struct ProjectSyncRecord {
    std::string project_uid, content_hash;
    int64_t local_revision_ts{};

    ProjectSyncRecord() = default;
    ProjectSyncRecord(std::string uid, std::string hash, int64_t revision);
    explicit ProjectSyncRecord(const pqxx::row& row);
};

struct Project {
    std::string uid;
    std::string name{"Unnamed Project"};
    std::string status{"ACTIVE"};
    std::string content_hash;
    unsigned int defect_count{}, event_count{};
    std::optional<int64_t> last_update_at;  // epoch millis
};

struct Defect {
    std::string project_uid, defect_no, risk_rating;
    std::string status{"OPEN"};
    std::vector<std::string> images;
};

}

#include "db/DBConnection.hpp"

void sl::db::DBConnection::initPreparedProjects() const {
    conn_->prepare("get_project_sync_record",
                   "SELECT project_uid, content_hash, local_revision_ts FROM project WHERE project_uid = $1");

    conn_->prepare("upsert_project",
                   "INSERT INTO project (project_uid, name, status, defect_count, event_count, last_update_at) "
                   "VALUES ($1, $2, $3, $4, $5, $6) "
                   "ON CONFLICT (project_uid) DO UPDATE SET "
                   "name = EXCLUDED.name, status = EXCLUDED.status, last_update_at = EXCLUDED.last_update_at, "
                   "updated_at = CURRENT_TIMESTAMP");

    conn_->prepare("update_project_counters",
                   "UPDATE project SET defect_count = $2, event_count = $3, updated_at = CURRENT_TIMESTAMP "
                   "WHERE project_uid = $1");

    conn_->prepare("commit_project_hash",
                   "UPDATE project SET content_hash = $2, local_revision_ts = $3, updated_at = CURRENT_TIMESTAMP "
                   "WHERE project_uid = $1");

    conn_->prepare("upsert_project_detail",
                   "INSERT INTO project_detail (project_uid, raw_json) VALUES ($1, $2) "
                   "ON CONFLICT (project_uid) DO UPDATE SET raw_json = EXCLUDED.raw_json, fetched_at = CURRENT_TIMESTAMP");

    conn_->prepare("upsert_defect",
                   "INSERT INTO defect (project_uid, defect_no, risk_rating, status, images) VALUES ($1, $2, $3, $4, $5) "
                   "ON CONFLICT (project_uid, defect_no) DO UPDATE SET "
                   "risk_rating = EXCLUDED.risk_rating, status = EXCLUDED.status, images = EXCLUDED.images, "
                   "updated_at = CURRENT_TIMESTAMP");

    // project_detail and defect rows go with it through ON DELETE CASCADE
    conn_->prepare("delete_project", "DELETE FROM project WHERE project_uid = $1");
}

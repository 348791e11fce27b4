#include "db/DBConnection.hpp"

void sl::db::DBConnection::initPreparedEvents() const {
    conn_->prepare("is_event_synced", "SELECT synced FROM event_sync WHERE event_uid = $1");

    conn_->prepare("track_event",
                   "INSERT INTO event_sync (event_uid, project_uid) VALUES ($1, $2) ON CONFLICT (event_uid) DO NOTHING");

    conn_->prepare("mark_event_synced",
                   "INSERT INTO event_sync (event_uid, project_uid, synced, synced_at, last_task_uid, package_digest) "
                   "VALUES ($1, $2, TRUE, CURRENT_TIMESTAMP, $3, $4) "
                   "ON CONFLICT (event_uid) DO UPDATE SET project_uid = EXCLUDED.project_uid, synced = TRUE, "
                   "synced_at = CURRENT_TIMESTAMP, last_task_uid = EXCLUDED.last_task_uid, "
                   "package_digest = EXCLUDED.package_digest");

    conn_->prepare("list_unsynced_events",
                   "SELECT event_uid FROM event_sync WHERE project_uid = $1 AND synced = FALSE ORDER BY created_at");
}

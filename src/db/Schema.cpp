#include "db/Schema.hpp"
#include "db/Transactions.hpp"
#include "config/Config.hpp"

namespace sl::db {

void init_db_tables() {
    Transactions::exec("init_db_tables::projects", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS project
(
    project_uid       TEXT        PRIMARY KEY,
    name              TEXT        NOT NULL DEFAULT 'Unnamed Project',
    status            TEXT        NOT NULL DEFAULT 'ACTIVE',
    content_hash      TEXT        NOT NULL DEFAULT '',
    defect_count      INTEGER     NOT NULL DEFAULT 0,
    event_count       INTEGER     NOT NULL DEFAULT 0,
    last_update_at    BIGINT,
    local_revision_ts BIGINT      NOT NULL DEFAULT 0,
    created_at        TIMESTAMP   DEFAULT CURRENT_TIMESTAMP,
    updated_at        TIMESTAMP   DEFAULT CURRENT_TIMESTAMP
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS project_detail
(
    project_uid TEXT      PRIMARY KEY REFERENCES project (project_uid) ON DELETE CASCADE,
    raw_json    TEXT      NOT NULL,
    fetched_at  TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS defect
(
    project_uid TEXT      NOT NULL REFERENCES project (project_uid) ON DELETE CASCADE,
    defect_no   TEXT      NOT NULL,
    risk_rating TEXT      NOT NULL DEFAULT '',
    status      TEXT      NOT NULL DEFAULT 'OPEN',
    images      TEXT      NOT NULL DEFAULT '[]',
    updated_at  TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    PRIMARY KEY (project_uid, defect_no)
);
        )");
    });

    Transactions::exec("init_db_tables::assets", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS asset_node
(
    node_id         TEXT      PRIMARY KEY,
    parent_id       TEXT,
    remote_id       TEXT      UNIQUE,
    file_type       TEXT,
    name            TEXT      NOT NULL,
    kind            TEXT      NOT NULL CHECK (kind IN ('folder', 'file')),
    size_bytes      BIGINT,
    download_status TEXT      NOT NULL DEFAULT 'pending'
                              CHECK (download_status IN ('pending', 'downloading', 'completed', 'failed')),
    local_path      TEXT,
    tree_path       TEXT      NOT NULL DEFAULT '',
    is_risk_matrix  BOOLEAN   NOT NULL DEFAULT FALSE,
    updated_at      TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS asset_node_owner
(
    node_id     TEXT NOT NULL REFERENCES asset_node (node_id) ON DELETE CASCADE,
    project_uid TEXT NOT NULL,
    PRIMARY KEY (node_id, project_uid)
);
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_asset_node_owner_project ON asset_node_owner (project_uid);");
    });

    Transactions::exec("init_db_tables::events", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS event_sync
(
    event_uid      TEXT      PRIMARY KEY,
    project_uid    TEXT      NOT NULL,
    synced         BOOLEAN   NOT NULL DEFAULT FALSE,
    synced_at      TIMESTAMP,
    last_task_uid  TEXT,
    package_digest TEXT,
    created_at     TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_event_sync_project ON event_sync (project_uid, synced);");
    });
}

void bootstrap(const config::DatabaseConfig& cfg) {
    Transactions::init(cfg);
    init_db_tables();
    Transactions::prepareAll();
    log::Registry::db()->info("[db] Schema ready on {}:{}/{}", cfg.host, cfg.port, cfg.name);
}

}

#pragma once

namespace sl::config {
struct DatabaseConfig;
}

namespace sl::db {

// CREATE TABLE IF NOT EXISTS for every table the sync engine owns.
void init_db_tables();

// Opens the pool, creates the schema and registers prepared statements on every connection.
void bootstrap(const config::DatabaseConfig& cfg);

}

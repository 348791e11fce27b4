#include "db/DBConnection.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace sl::log;

namespace sl::db {

static std::string quoted(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    return out + "'";
}

std::string DBConnection::connectionString(const config::DatabaseConfig& cfg) {
    std::string str = "host=" + quoted(cfg.host) + " port=" + std::to_string(cfg.port) + " dbname=" + quoted(cfg.name) +
                      " user=" + quoted(cfg.user);

    if (!cfg.password_env.empty()) {
        if (const char* pass = std::getenv(cfg.password_env.c_str()); pass && *pass)
            str += " password=" + quoted(pass);
        else
            Registry::db()->debug("[DBConnection] {} is not set, relying on peer auth or ~/.pgpass", cfg.password_env);
    }

    return str;
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : conn_(std::make_unique<pqxx::connection>(connectionString(cfg))) {}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedProjects();
    initPreparedAssets();
    initPreparedEvents();
}

}

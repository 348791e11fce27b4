#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace sl::config {
struct DatabaseConfig;
}

namespace sl::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

    static std::string connectionString(const config::DatabaseConfig& cfg);

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedProjects() const;
    void initPreparedAssets() const;
    void initPreparedEvents() const;
};

}

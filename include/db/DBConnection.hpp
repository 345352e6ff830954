#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace ovdm::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedDefinitions() const;
    void initPreparedCoreVars() const;
    void initPreparedExtraDirectories() const;
    void initPreparedLowerings() const;
};

// libpq keyword/value connection string, values single-quoted.
std::string connectionString(const config::DatabaseConfig& cfg);

} // namespace ovdm::db

#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/pqxx>

namespace fsnap::db {

// One libpq connection with the fsnap schema and prepared statements in place.
class DBConnection {
public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    DBConnection(const DBConnection&) = delete;
    DBConnection& operator=(const DBConnection&) = delete;

    [[nodiscard]] pqxx::connection& get() const;

    // CREATE TABLE / INDEX IF NOT EXISTS for both tables
    void initTables(pqxx::work& txn) const;

    void initPrepared() const;

private:
    config::DatabaseConfig cfg_;
    std::unique_ptr<pqxx::connection> conn_;

    [[nodiscard]] std::string connectionString() const;
};

}

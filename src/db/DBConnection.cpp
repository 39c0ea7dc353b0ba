#include "db/DBConnection.hpp"
#include "util/errors.hpp"

#include <cstdlib>
#include <fmt/format.h>

using namespace fsnap::db;

namespace {

// libpq keyword/value quoting
std::string quoteValue(const std::string& v) {
    std::string out = "'";
    for (const char c : v) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

}

DBConnection::DBConnection(const config::DatabaseConfig& cfg) : cfg_(cfg) {
    try {
        conn_ = std::make_unique<pqxx::connection>(connectionString());
    } catch (const std::exception& e) {
        throw StoreError("DBConnection: cannot connect to " + cfg_.host + ":" + std::to_string(cfg_.port) + "/" +
                         cfg_.name + ": " + e.what());
    }
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

std::string DBConnection::connectionString() const {
    std::string s = "host=" + quoteValue(cfg_.host) +
                    " port=" + std::to_string(cfg_.port) +
                    " dbname=" + quoteValue(cfg_.name) +
                    " user=" + quoteValue(cfg_.user);

    if (!cfg_.password_env.empty())
        if (const char* pass = std::getenv(cfg_.password_env.c_str())) s += " password=" + quoteValue(pass);

    return s;
}

void DBConnection::initTables(pqxx::work& txn) const {
    const auto imports = conn_->quote_name(cfg_.import_table);
    const auto files = conn_->quote_name(cfg_.file_record_table);


    txn.exec(fmt::format(R"(
CREATE TABLE IF NOT EXISTS {}
(
    id          UUID            PRIMARY KEY,
    seq         BIGSERIAL       UNIQUE,
    timestamp   BIGINT          NOT NULL,
    name        TEXT            NOT NULL,
    tags        TEXT            NOT NULL DEFAULT ''
);
    )", imports));

    txn.exec(fmt::format(R"(
CREATE TABLE IF NOT EXISTS {0}
(
    id          BIGSERIAL           PRIMARY KEY,
    digest      BYTEA               NOT NULL,
    dir_name    TEXT                NOT NULL,
    base_name   TEXT                NOT NULL,
    created     DOUBLE PRECISION    NOT NULL,
    modified    DOUBLE PRECISION    NOT NULL,
    size        BIGINT              NOT NULL,
    archived    BOOLEAN             NOT NULL DEFAULT FALSE,
    file_group  TEXT,
    file_type   TEXT,
    tags        TEXT                NOT NULL DEFAULT '',
    import_id   UUID                NOT NULL REFERENCES {1} (id) ON DELETE CASCADE,
    UNIQUE (import_id, dir_name, base_name)
);
    )", files, imports));

    for (const auto* col : {"digest", "dir_name", "base_name", "file_group", "file_type"})
        txn.exec(fmt::format("CREATE INDEX IF NOT EXISTS {} ON {} ({})",
                             conn_->quote_name(cfg_.file_record_table + "_" + col + "_idx"), files, col));

    txn.exec(fmt::format("CREATE INDEX IF NOT EXISTS {} ON {} (name, timestamp)",
                         conn_->quote_name(cfg_.import_table + "_name_timestamp_idx"), imports));

}

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw StoreError("DBConnection: connection is not open");

    const auto imports = conn_->quote_name(cfg_.import_table);
    const auto files = conn_->quote_name(cfg_.file_record_table);

    conn_->prepare("insert_import",
                   fmt::format("INSERT INTO {} (id, timestamp, name, tags) VALUES ($1, $2, $3, $4)", imports));

    conn_->prepare("get_import",
                   fmt::format("SELECT id, timestamp, name, tags FROM {} WHERE id = $1", imports));

    conn_->prepare("import_exists",
                   fmt::format("SELECT EXISTS(SELECT 1 FROM {} WHERE id = $1)", imports));

    conn_->prepare("get_latest_import_id",
                   fmt::format("SELECT id FROM {} WHERE name = $1 ORDER BY timestamp DESC, seq DESC LIMIT 1",
                               imports));

    conn_->prepare("insert_file_record",
                   fmt::format("INSERT INTO {} (digest, dir_name, base_name, created, modified, size, archived, "
                               "file_group, file_type, tags, import_id) "
                               "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)", files));

    conn_->prepare("list_file_records",
                   fmt::format("SELECT digest, dir_name, base_name, created, modified, size, archived, "
                               "file_group, file_type, tags FROM {} WHERE import_id = $1 "
                               "ORDER BY dir_name, base_name", files));
}

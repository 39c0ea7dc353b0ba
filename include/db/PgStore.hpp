#pragma once

#include "db/DBConnection.hpp"
#include "db/Store.hpp"

namespace fsnap::db {

// PostgreSQL store. Each instance owns one connection, so each worker opens
// its own PgStore.
class PgStore : public Store {
public:
    PgStore(const config::DatabaseConfig& cfg, std::shared_ptr<spdlog::logger> log);

    snapshot::model::ImportId createImport(const std::string& name, const snapshot::model::Tags& tags) override;

    void importFiles(const snapshot::model::ImportId& id,
                     const std::vector<snapshot::model::FileRecord>& records) override;

    snapshot::model::Import fetchImport(const snapshot::model::ImportId& id) override;

    std::optional<snapshot::model::ImportId> fetchLatestImportId(const std::string& name) override;

    std::vector<snapshot::model::FileRecord> fetchRecords(const snapshot::model::ImportId& id) override;

private:
    std::unique_ptr<DBConnection> conn_;
};

}

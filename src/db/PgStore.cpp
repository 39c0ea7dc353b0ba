#include "db/PgStore.hpp"
#include "db/Transactions.hpp"
#include "db/encoding/tags.hpp"

#include <chrono>

using namespace fsnap::db;
using namespace fsnap::snapshot::model;

namespace {

FileRecord toFileRecord(const pqxx::row& row) {
    FileRecord f;
    const pqxx::binarystring digest(row["digest"]);
    f.digest.assign(digest.begin(), digest.end());
    f.dir_name = row["dir_name"].as<std::string>();
    f.base_name = row["base_name"].as<std::string>();
    f.created = row["created"].as<double>();
    f.modified = row["modified"].as<double>();
    f.size = row["size"].as<uintmax_t>();
    f.archived = row["archived"].as<bool>();
    if (!row["file_group"].is_null()) f.file_group = row["file_group"].as<std::string>();
    if (!row["file_type"].is_null()) f.file_type = row["file_type"].as<std::string>();
    f.metadata = encoding::from_tag_string(row["tags"].as<std::string>());
    return f;
}

}

PgStore::PgStore(const config::DatabaseConfig& cfg, std::shared_ptr<spdlog::logger> log)
    : Store(std::move(log)), conn_(std::make_unique<DBConnection>(cfg)) {
    Transactions::exec(*conn_, log_, "PgStore::initTables", [&](pqxx::work& txn) { conn_->initTables(txn); });
    conn_->initPrepared();
    log_->debug("[PgStore] Connected to {}:{}/{}", cfg.host, cfg.port, cfg.name);
}

ImportId PgStore::createImport(const std::string& name, const Tags& tags) {
    const auto encoded = encoding::to_tag_string(normalizeTags(tags));
    const auto id = newImportId();
    const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    Transactions::exec(*conn_, log_, "PgStore::createImport", [&](pqxx::work& txn) {
        pqxx::params p{toHex(id), static_cast<int64_t>(timestamp), name, encoded};
        txn.exec(pqxx::prepped{"insert_import"}, p);
    });

    log_->debug("[PgStore] Created import {} '{}'", toHex(id), name);
    return id;
}

void PgStore::importFiles(const ImportId& id, const std::vector<FileRecord>& records) {
    Transactions::exec(*conn_, log_, "PgStore::importFiles", [&](pqxx::work& txn) {
        for (const auto& f : records) {
            const pqxx::binarystring digest(f.digest.data(), f.digest.size());
            pqxx::params p{digest, f.dir_name, f.base_name, f.created, f.modified,
                           static_cast<int64_t>(f.size), f.archived, f.file_group, f.file_type,
                           encoding::to_tag_string(f.metadata), toHex(id)};
            txn.exec(pqxx::prepped{"insert_file_record"}, p);
        }
    });

    log_->debug("[PgStore] Imported {} records into {}", records.size(), toHex(id));
}

Import PgStore::fetchImport(const ImportId& id) {
    return Transactions::exec(*conn_, log_, "PgStore::fetchImport", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"get_import"}, pqxx::params{toHex(id)});
        if (res.empty()) throw NotFoundError("Import not found: " + toHex(id));

        const auto row = res[0];
        return Import{
            parseImportId(row["id"].as<std::string>()),
            row["timestamp"].as<int64_t>(),
            row["name"].as<std::string>(),
            encoding::from_tag_string(row["tags"].as<std::string>())
        };
    });
}

std::optional<ImportId> PgStore::fetchLatestImportId(const std::string& name) {
    return Transactions::exec(*conn_, log_, "PgStore::fetchLatestImportId",
                              [&](pqxx::work& txn) -> std::optional<ImportId> {
        const auto res = txn.exec(pqxx::prepped{"get_latest_import_id"}, pqxx::params{name});
        if (res.empty()) return std::nullopt;
        return parseImportId(res.one_field().as<std::string>());
    });
}

std::vector<FileRecord> PgStore::fetchRecords(const ImportId& id) {
    return Transactions::exec(*conn_, log_, "PgStore::fetchRecords", [&](pqxx::work& txn) {
        if (!txn.exec(pqxx::prepped{"import_exists"}, pqxx::params{toHex(id)}).one_field().as<bool>())
            throw NotFoundError("Import not found: " + toHex(id));

        std::vector<FileRecord> out;
        for (const auto& row : txn.exec(pqxx::prepped{"list_file_records"}, pqxx::params{toHex(id)}))
            out.push_back(toFileRecord(row));
        return out;
    });
}

#include "db/MemoryStore.hpp"
#include "db/encoding/tags.hpp"
#include "util/errors.hpp"

#include <chrono>
#include <set>
#include <tuple>

using namespace fsnap::db;
using namespace fsnap::snapshot::model;

namespace {

int64_t nowSeconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

}

MemoryStore::MemoryStore(std::shared_ptr<spdlog::logger> log, Clock clock)
    : Store(std::move(log)), clock_(clock ? std::move(clock) : Clock{nowSeconds}) {}

ImportId MemoryStore::createImport(const std::string& name, const Tags& tags) {
    auto normalized = normalizeTags(tags);
    if (!encoding::isEncodable(normalized))
        throw TagFormatError("MemoryStore::createImport: tags cannot be encoded for '" + name + "'");

    std::scoped_lock lock(mutex_);

    Import i{newImportId(), clock_(), name, std::move(normalized)};
    const auto id = i.id;
    imports_.emplace(id, Stored{std::move(i), nextSeq_++, {}});

    log_->debug("[MemoryStore] Created import {} '{}'", toHex(id), name);
    return id;
}

void MemoryStore::importFiles(const ImportId& id, const std::vector<FileRecord>& records) {
    for (const auto& r : records)
        if (!encoding::isEncodable(r.metadata))
            throw TagFormatError("MemoryStore::importFiles: metadata cannot be encoded for " + r.fileName());

    std::scoped_lock lock(mutex_);

    const auto it = imports_.find(id);
    if (it == imports_.end())
        throw StoreError("MemoryStore::importFiles: unknown import " + toHex(id));

    auto& stored = it->second.records;

    std::set<std::pair<std::string, std::string>> paths;
    for (const auto& r : stored) paths.emplace(r.dir_name, r.base_name);
    for (const auto& r : records)
        if (!paths.emplace(r.dir_name, r.base_name).second)
            throw StoreError("MemoryStore::importFiles: duplicate path " + r.fileName() + " in import " + toHex(id));

    stored.insert(stored.end(), records.begin(), records.end());
    log_->debug("[MemoryStore] Imported {} records into {}", records.size(), toHex(id));
}

Import MemoryStore::fetchImport(const ImportId& id) {
    std::scoped_lock lock(mutex_);
    const auto it = imports_.find(id);
    if (it == imports_.end()) throw NotFoundError("Import not found: " + toHex(id));
    return it->second.import;
}

std::optional<ImportId> MemoryStore::fetchLatestImportId(const std::string& name) {
    std::scoped_lock lock(mutex_);

    const Stored* latest = nullptr;
    for (const auto& [id, s] : imports_) {
        if (s.import.name != name) continue;
        if (!latest || std::tie(s.import.timestamp, s.seq) > std::tie(latest->import.timestamp, latest->seq))
            latest = &s;
    }

    if (!latest) return std::nullopt;
    return latest->import.id;
}

std::vector<FileRecord> MemoryStore::fetchRecords(const ImportId& id) {
    std::scoped_lock lock(mutex_);
    const auto it = imports_.find(id);
    if (it == imports_.end()) throw NotFoundError("Import not found: " + toHex(id));
    return it->second.records;
}

size_t MemoryStore::importCount() const {
    std::scoped_lock lock(mutex_);
    return imports_.size();
}

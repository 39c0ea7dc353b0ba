#pragma once

#include "snapshot/model/CompareState.hpp"
#include "snapshot/model/FileRecord.hpp"
#include "snapshot/model/Import.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace fsnap::db {

// An import diffed against the newest import of its lineage.
struct Comparison {
    snapshot::model::Import original, latest;
    std::vector<snapshot::model::CompareState> states;
};

// Persistence for imports and their file records. Each call is atomic: it
// applies completely or not at all. Failures surface as StoreError carrying the
// operation name, except NotFoundError and TagFormatError which pass through.
class Store {
public:
    explicit Store(std::shared_ptr<spdlog::logger> log) : log_(std::move(log)) {}
    virtual ~Store() = default;

    // New id, timestamp = now, empty record set.
    virtual snapshot::model::ImportId createImport(const std::string& name, const snapshot::model::Tags& tags) = 0;

    // Appends a batch. May be called repeatedly and concurrently for one import.
    virtual void importFiles(const snapshot::model::ImportId& id,
                             const std::vector<snapshot::model::FileRecord>& records) = 0;

    virtual snapshot::model::Import fetchImport(const snapshot::model::ImportId& id) = 0;

    // Greatest timestamp among imports named `name`, ties going to the later one created.
    virtual std::optional<snapshot::model::ImportId> fetchLatestImportId(const std::string& name) = 0;

    virtual std::vector<snapshot::model::FileRecord> fetchRecords(const snapshot::model::ImportId& id) = 0;

    // Loads both record sets and joins them in memory.
    std::vector<snapshot::model::CompareState> fetchCorrespondence(const snapshot::model::ImportId& prevId,
                                                                   const snapshot::model::ImportId& nextId,
                                                                   bool compareDigests);

    // Throws NotFoundError for an unknown id and NoNewerVersionError when id is
    // already the newest of its lineage.
    Comparison fetchCompareLatest(const snapshot::model::ImportId& id, bool compareDigests);

protected:
    std::shared_ptr<spdlog::logger> log_;
};

// Each worker opens its own handle through one of these.
using StoreFactory = std::function<std::shared_ptr<Store>()>;

}

#pragma once

#include "config/Config.hpp"
#include "db/Store.hpp"
#include "scan/Scanner.hpp"
#include "snapshot/model/Action.hpp"

#include <nlohmann/json_fwd.hpp>

namespace fsnap::cmd {

struct StoreResult {
    snapshot::model::ImportId id;
    scan::ScanReport report;
};

// Scans spec.root_dir and persists the records under a new import. Each
// non-empty group is imported by its own worker (inline when !multithread),
// through its own store handle.
StoreResult store(const config::SnapshotSpec& spec, const db::StoreFactory& stores);

// Diffs `id` against the newest import of its lineage:
// {"original_id", "new_id", "actions": [...]}
nlohmann::json diff(const config::SnapshotSpec& spec, db::Store& store, const snapshot::model::ImportId& id);

nlohmann::json diffJson(const snapshot::model::Import& original,
                        const snapshot::model::Import& latest,
                        const std::vector<snapshot::model::Action>& actions);

}

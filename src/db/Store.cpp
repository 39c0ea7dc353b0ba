#include "db/Store.hpp"
#include "snapshot/Reconciler.hpp"
#include "util/errors.hpp"

using namespace fsnap::db;
using namespace fsnap::snapshot;
using namespace fsnap::snapshot::model;

std::vector<CompareState> Store::fetchCorrespondence(const ImportId& prevId, const ImportId& nextId,
                                                     const bool compareDigests) {
    const auto prev = fetchRecords(prevId);
    const auto next = fetchRecords(nextId);
    return Reconciler(log_, compareDigests).correspond(prev, next);
}

Comparison Store::fetchCompareLatest(const ImportId& id, const bool compareDigests) {
    auto original = fetchImport(id);

    const auto latestId = fetchLatestImportId(original.name);
    if (!latestId || *latestId == id)
        throw NoNewerVersionError("Import " + toHex(id) + " is the latest version of '" + original.name + "'");

    auto latest = fetchImport(*latestId);
    log_->info("[Store] Comparing {} against latest {} of '{}'", toHex(id), toHex(*latestId), original.name);

    auto states = fetchCorrespondence(id, *latestId, compareDigests);
    return {std::move(original), std::move(latest), std::move(states)};
}

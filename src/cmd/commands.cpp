#include "cmd/commands.hpp"
#include "concurrency/TaskGroup.hpp"
#include "log/Registry.hpp"
#include "snapshot/Reconciler.hpp"

#include <nlohmann/json.hpp>

using namespace fsnap;
using namespace fsnap::snapshot::model;

fsnap::cmd::StoreResult fsnap::cmd::store(const config::SnapshotSpec& spec, const db::StoreFactory& stores) {
    const auto logger = log::Registry::fsnap();

    const scan::Scanner scanner(scan::ScanOptions::fromSpec(spec), log::Registry::scan(), log::Registry::digest());

    StoreResult result{};
    const auto plan = scanner.plan(result.report);

    result.id = stores()->createImport(spec.name, spec.tags);
    logger->info("[store] Import {} '{}' created, {} files to record", toHex(result.id), spec.name, plan.fileCount());

    std::vector<scan::ScanReport> reports(plan.groups.size());
    concurrency::TaskGroup group(logger, spec.multithread);

    for (size_t i = 0; i < plan.groups.size(); ++i) {
        const auto& g = plan.groups[i];
        if (g.entries.empty()) continue;

        group.push(g.name, [&, i] {
            const auto handle = stores();
            const auto records = scanner.records(plan.groups[i].entries, reports[i]);
            handle->importFiles(result.id, records);
            logger->info("[store] Group '{}': {} records", plan.groups[i].name, records.size());
        });
    }

    group.wait();

    for (const auto& r : reports) result.report.merge(r);
    logger->info("[store] Import {} complete: {} recorded ({} without metadata), {} skipped, {} unreadable directories",
              toHex(result.id), result.report.recorded_files, result.report.unencodable_files,
              result.report.skipped_files, result.report.unreadable_dirs.size());

    return result;
}

nlohmann::json fsnap::cmd::diff(const config::SnapshotSpec& spec, db::Store& store, const ImportId& id) {
    const auto cmp = store.fetchCompareLatest(id, spec.compare_digests);

    const snapshot::Reconciler reconciler(log::Registry::diff(), spec.compare_digests);

    const auto actions = reconciler.actions(cmp.states);

    log::Registry::diff()->info("[diff] {} -> {}: {} actions", toHex(cmp.original.id), toHex(cmp.latest.id),
                                actions.size());
    return diffJson(cmp.original, cmp.latest, actions);
}

nlohmann::json fsnap::cmd::diffJson(const Import& original, const Import& latest, const std::vector<Action>& actions) {
    nlohmann::json j;
    j["original_id"] = toHex(original.id);
    j["new_id"] = toHex(latest.id);
    j["actions"] = nlohmann::json::array();
    for (const auto& a : actions) j["actions"].push_back(a);
    return j;
}

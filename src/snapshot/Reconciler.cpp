#include "snapshot/Reconciler.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <map>
#include <numeric>

using namespace fsnap::snapshot;
using namespace fsnap::snapshot::model;

namespace {

std::vector<size_t> byPath(const std::vector<FileRecord>& records) {
    std::vector<size_t> idx(records.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::ranges::sort(idx, {}, [&](const size_t i) { return Reconciler::pathKey(records[i]); });
    return idx;
}

}

Reconciler::Reconciler(std::shared_ptr<spdlog::logger> log, const bool compareDigests)
    : log_(std::move(log)), compareDigests_(compareDigests) {}

ContentKey Reconciler::contentKey(const FileRecord& f) const {
    if (compareDigests_) {
        if (f.digest.empty()) return std::nullopt;
        return std::make_tuple(f.digest, uintmax_t{0}, 0.0);
    }
    return std::make_tuple(Digest{}, f.size, f.modified);
}

PathKey Reconciler::pathKey(const FileRecord& f) { return {f.dir_name, f.base_name}; }

std::vector<CompareState> Reconciler::correspond(const std::vector<FileRecord>& prev,
                                                 const std::vector<FileRecord>& next) const {
    const auto prevOrder = byPath(prev), nextOrder = byPath(next);

    std::vector<bool> prevUsed(prev.size(), false), nextUsed(next.size(), false);
    std::vector<CompareState> out;
    out.reserve(std::max(prev.size(), next.size()));

    std::map<PathKey, size_t> prevByPath;
    for (const auto i : prevOrder) prevByPath.emplace(pathKey(prev[i]), i);

    // same path: unchanged or modified
    std::map<ContentKey, size_t> unchanged, modified;
    for (const auto j : nextOrder) {
        const auto it = prevByPath.find(pathKey(next[j]));
        if (it == prevByPath.end()) continue;

        const auto i = it->second;
        prevUsed[i] = nextUsed[j] = true;
        out.emplace_back(Both{prev[i], next[j], false});

        if (const auto key = contentKey(prev[i]); key) {
            // maps keep the lowest path, nextOrder is path-sorted
            if (key == contentKey(next[j])) unchanged.emplace(*key, i);
            else modified.emplace(*key, i);
        }
    }

    // content that survives unchanged elsewhere: copies
    for (const auto j : nextOrder) {
        if (nextUsed[j]) continue;
        const auto key = contentKey(next[j]);
        if (!key) continue;

        if (const auto it = unchanged.find(key); it != unchanged.end()) {
            nextUsed[j] = true;
            out.emplace_back(Both{prev[it->second], next[j], true});
        }
    }

    // relocations among what is left, grouped by content
    std::map<ContentKey, std::pair<std::vector<size_t>, std::vector<size_t>>> byContent;
    for (const auto i : prevOrder)
        if (!prevUsed[i])
            if (auto key = contentKey(prev[i])) byContent[key].first.push_back(i);
    for (const auto j : nextOrder)
        if (!nextUsed[j])
            if (auto key = contentKey(next[j])) byContent[key].second.push_back(j);

    for (const auto& [key, sides] : byContent) {
        const auto& [ps, ns] = sides;
        if (ps.empty() || ns.empty()) continue;

        std::vector<std::pair<size_t, size_t>> pairs;
        const auto pairBy = [&](auto&& same) {
            for (const auto i : ps) {
                if (prevUsed[i]) continue;
                for (const auto j : ns) {
                    if (nextUsed[j] || !same(prev[i], next[j])) continue;
                    prevUsed[i] = nextUsed[j] = true;
                    pairs.emplace_back(i, j);
                    break;
                }
            }
        };

        pairBy([](const FileRecord& p, const FileRecord& n) { return p.base_name == n.base_name; });
        pairBy([](const FileRecord& p, const FileRecord& n) { return p.dir_name == n.dir_name; });
        pairBy([](const FileRecord&, const FileRecord&) { return true; });

        std::ranges::sort(pairs, {}, [&](const auto& pr) { return pathKey(prev[pr.first]); });
        for (const auto& [i, j] : pairs) out.emplace_back(Both{prev[i], next[j], false});

        // more next than previous: the extras duplicate the relocated content
        for (const auto j : ns) {
            if (nextUsed[j]) continue;
            nextUsed[j] = true;
            out.emplace_back(Both{prev[pairs.front().first], next[j], true});
        }
    }

    // content a modified file held before: copies of its previous version
    for (const auto j : nextOrder) {
        if (nextUsed[j]) continue;
        if (const auto it = modified.find(contentKey(next[j])); it != modified.end()) {
            nextUsed[j] = true;
            out.emplace_back(Both{prev[it->second], next[j], true});
        }
    }

    for (const auto i : prevOrder)
        if (!prevUsed[i]) out.emplace_back(PrevOnly{prev[i]});
    for (const auto j : nextOrder)
        if (!nextUsed[j]) out.emplace_back(NextOnly{next[j]});

    log_->debug("[Reconciler] Joined {} previous and {} next records into {} states",
                prev.size(), next.size(), out.size());
    return out;
}

std::optional<Action> Reconciler::classify(const CompareState& state) const {
    if (const auto* s = std::get_if<PrevOnly>(&state)) return Removed{s->original};
    if (const auto* s = std::get_if<NextOnly>(&state)) return Created{s->next};

    const auto& both = std::get<Both>(state);
    const auto& p = both.original;
    const auto& n = both.next;

    const auto pk = contentKey(p), nk = contentKey(n);
    const bool contentEqual = pk == nk;
    const bool sameDir = p.dir_name == n.dir_name;
    const bool sameName = p.base_name == n.base_name;

    if (sameDir && sameName) {
        if (contentEqual) return std::nullopt;
        return Modified{p, n.modified, n.size, n.digest};
    }

    if (!contentEqual || !pk)
        throw ReconcileError("[Reconciler] Joined records share neither path nor content: " +
                             p.fileName() + " -> " + n.fileName());

    if (both.is_copy) return Copied{p, n};

    if (!sameDir) {
        if (n.archived) return Archived{p, n.dir_name, n.metadata};
        return Moved{p, n.dir_name, n.metadata};
    }

    return Renamed{p, n.base_name, n.metadata};
}

std::vector<Action> Reconciler::actions(const std::vector<CompareState>& states) const {
    std::vector<Action> actions;
    for (const auto& state : states)
        if (auto a = classify(state)) actions.push_back(std::move(*a));

    std::ranges::stable_sort(actions, {}, [](const Action& a) { return pathKey(subject(a)); });

    std::map<std::string_view, size_t> counts;
    for (const auto& a : actions) ++counts[typeName(a)];
    for (const auto& [type, n] : counts) log_->info("[Reconciler] {}: {}", type, n);
    log_->info("[Reconciler] {} actions from {} states", actions.size(), states.size());

    return actions;
}

std::vector<Action> Reconciler::diff(const std::vector<FileRecord>& prev, const std::vector<FileRecord>& next) const {
    return actions(correspond(prev, next));
}

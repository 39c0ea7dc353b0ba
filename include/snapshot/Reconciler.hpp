#pragma once

#include "snapshot/model/Action.hpp"
#include "snapshot/model/CompareState.hpp"

#include <memory>
#include <optional>
#include <tuple>
#include <vector>
#include <spdlog/logger.h>

namespace fsnap::snapshot {

// Digest when comparing digests, else (size, modified). Empty for an
// un-digested record under digest comparison: such a record never joins by
// content.
using ContentKey = std::optional<std::tuple<model::Digest, uintmax_t, double>>;
using PathKey = std::pair<std::string, std::string>;

class Reconciler {
public:
    Reconciler(std::shared_ptr<spdlog::logger> log, bool compareDigests);

    [[nodiscard]] ContentKey contentKey(const model::FileRecord& f) const;
    [[nodiscard]] static PathKey pathKey(const model::FileRecord& f);

    // One-to-one join of two record sets. Every previous record ends up in
    // exactly one PrevOnly or Both, every next record in exactly one NextOnly
    // or Both:
    //   1. same path                       -> Both (unchanged or modified)
    //   2. content unchanged elsewhere     -> Both, is_copy
    //   3. same content, new path          -> Both, preferring same base name,
    //                                         then same directory, then path order;
    //                                         surplus next records are copies of
    //                                         the relocated original
    //   4. content a modified file held    -> Both, is_copy of its previous version
    //   5. the rest                        -> PrevOnly / NextOnly
    [[nodiscard]] std::vector<model::CompareState> correspond(const std::vector<model::FileRecord>& prev,
                                                              const std::vector<model::FileRecord>& next) const;

    // nullopt for an unchanged pair. Throws ReconcileError for a pair the join
    // cannot produce.
    [[nodiscard]] std::optional<model::Action> classify(const model::CompareState& state) const;

    // Classified states, ordered by the path of the record each action describes.
    [[nodiscard]] std::vector<model::Action> actions(const std::vector<model::CompareState>& states) const;

    [[nodiscard]] std::vector<model::Action> diff(const std::vector<model::FileRecord>& prev,
                                                  const std::vector<model::FileRecord>& next) const;

    [[nodiscard]] bool comparesDigests() const { return compareDigests_; }

private:
    std::shared_ptr<spdlog::logger> log_;
    bool compareDigests_;
};

}

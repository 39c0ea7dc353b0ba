#pragma once

#include "snapshot/model/FileRecord.hpp"

#include <set>
#include <variant>

namespace fsnap::snapshot::model {

struct NotArchived {};

// Archived when metadata[key] is one of values; an empty values set means the
// key merely has to be present.
struct HasMetadata {
    std::string key;
    std::set<std::string> values;
};

using ArchivedBy = std::variant<NotArchived, HasMetadata>;

struct NoCalc {};

// fmt format string with named fields, e.g. "{protocol} // {account}"
struct FromMetadata {
    std::string format;
};

using CalcBy = std::variant<NoCalc, FromMetadata>;

[[nodiscard]] bool isArchived(const ArchivedBy& policy, const Metadata& metadata);

// nullopt for NoCalc, or when the format references a field the metadata lacks.
// A malformed format throws fmt::format_error.
[[nodiscard]] std::optional<std::string> calculate(const CalcBy& policy, const Metadata& metadata);

// Throws fmt::format_error unless the format is well formed and every field is named.
void validate(const CalcBy& policy);

}

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <boost/uuid/uuid.hpp>
#include <nlohmann/json_fwd.hpp>

namespace fsnap::snapshot::model {

using ImportId = boost::uuids::uuid;
using Tags = std::map<std::string, std::string>;

// One immutable snapshot. Imports sharing a name form a lineage.
struct Import {
    ImportId id{};
    int64_t timestamp{};
    std::string name{};
    Tags tags{};
};

[[nodiscard]] ImportId newImportId();

// 32 lowercase hex digits, no dashes
[[nodiscard]] std::string toHex(const ImportId& id);

// Accepts the hex form and the dashed UUID form. Throws std::invalid_argument.
[[nodiscard]] ImportId parseImportId(const std::string& s);

// Tag keys are case-insensitive: trimmed and lowercased. Throws TagFormatError
// when two keys normalize to the same one.
[[nodiscard]] Tags normalizeTags(const Tags& tags);

void to_json(nlohmann::json& j, const Import& i);

}

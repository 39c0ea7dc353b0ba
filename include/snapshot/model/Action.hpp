#pragma once

#include "snapshot/model/FileRecord.hpp"

#include <string_view>
#include <variant>

namespace fsnap::snapshot::model {

struct Created {
    FileRecord next;
};

struct Removed {
    FileRecord original;
};

struct Copied {
    FileRecord original, copy;
};

struct Moved {
    FileRecord original;
    std::string dir_name;
    Metadata metadata;
};

struct Renamed {
    FileRecord original;
    std::string base_name;
    Metadata metadata;
};

// A move whose destination is flagged archived by policy.
struct Archived {
    FileRecord original;
    std::string dir_name;
    Metadata metadata;
};

struct Modified {
    FileRecord original;
    double modified;
    uintmax_t size;
    Digest digest;
};

using Action = std::variant<Created, Removed, Copied, Moved, Renamed, Archived, Modified>;

[[nodiscard]] std::string_view typeName(const Action& action);

// The record an action describes: the new file for Created, the copy for
// Copied, the original for everything else.
[[nodiscard]] const FileRecord& subject(const Action& action);

// Replays a Moved/Renamed/Archived/Modified onto a record. Created, Removed and
// Copied leave it untouched.
[[nodiscard]] FileRecord apply(const FileRecord& record, const Action& action);

void to_json(nlohmann::json& j, const Action& action);

}

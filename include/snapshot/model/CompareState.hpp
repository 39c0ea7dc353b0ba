#pragma once

#include "snapshot/model/FileRecord.hpp"

#include <variant>

namespace fsnap::snapshot::model {

// Present in the previous import only.
struct PrevOnly {
    FileRecord original;
};

// Present in the next import only.
struct NextOnly {
    FileRecord next;
};

// Joined by content key or path key. is_copy marks a same-content record at a
// new path whose content also survives unchanged elsewhere.
struct Both {
    FileRecord original, next;
    bool is_copy{false};
};

using CompareState = std::variant<PrevOnly, NextOnly, Both>;

}

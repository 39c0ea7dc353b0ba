#pragma once

#include <stdexcept>
#include <string>

namespace fsnap {

// Malformed path template. Raised at compile time only, never while matching.
struct PatternError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A file or directory could not be read. Fatal only for the scan root.
struct ScanIOError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct StoreError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct NotFoundError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The requested import is already the newest of its lineage.
struct NoNewerVersionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct TagFormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Classification reached a branch the join can never produce.
struct ReconcileError : std::logic_error {
    using std::logic_error::logic_error;
};

}

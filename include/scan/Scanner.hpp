#pragma once

#include "pattern/PathTemplate.hpp"
#include "snapshot/model/FileRecord.hpp"
#include "snapshot/model/Policy.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace fsnap::config {
struct SnapshotSpec;
}

namespace fsnap::scan {

inline constexpr const char* UNMATCHED_GROUP = "unmatched";

struct Category {
    std::string name;
    std::vector<pattern::PathTemplate> templates;
};

struct ScanOptions {
    std::filesystem::path root;
    std::vector<Category> categories;
    bool digest = true;
    snapshot::model::ArchivedBy archived_by = snapshot::model::NotArchived{};
    snapshot::model::CalcBy file_group_by = snapshot::model::NoCalc{};
    snapshot::model::CalcBy file_type_by = snapshot::model::NoCalc{};

    // Compiles every pattern of the spec. Throws PatternError.
    static ScanOptions fromSpec(const config::SnapshotSpec& spec);
};

// A regular file found by the walk and already classified.
struct Entry {
    std::string dir_name, base_name;
    std::optional<size_t> category;   // index into ScanOptions::categories, empty when unmatched
    snapshot::model::Metadata metadata;

    [[nodiscard]] std::string relativePath() const;
};

// Work split into one group per category, in category order, followed by the
// unmatched files. Each file lands in exactly one group.
struct Plan {
    struct Group {
        std::string name;
        std::vector<Entry> entries;
    };

    std::vector<Group> groups;

    [[nodiscard]] size_t fileCount() const;
};

struct ScanReport {
    std::vector<std::string> unreadable_dirs;
    size_t skipped_files = 0;
    size_t unencodable_files = 0;   // recorded as unmatched, their captures could not be stored
    size_t recorded_files = 0;

    void merge(const ScanReport& other);
};

class Scanner {
public:
    Scanner(ScanOptions options,
            std::shared_ptr<spdlog::logger> log,
            std::shared_ptr<spdlog::logger> digestLog);

    // Walks the tree once without following symlinks. Throws ScanIOError when
    // the root itself cannot be enumerated; unreadable subdirectories are
    // logged and recorded in the report. A file whose captures cannot be
    // stored falls through to the next pattern, and to the unmatched group
    // when none is left.
    [[nodiscard]] Plan plan(ScanReport& report) const;

    // stat + optional digest + policies for one group. Files that vanish or
    // cannot be read are skipped and counted.
    [[nodiscard]] std::vector<snapshot::model::FileRecord> records(const std::vector<Entry>& entries,
                                                                   ScanReport& report) const;

    // Sequential plan() + records() over every group.
    [[nodiscard]] std::vector<snapshot::model::FileRecord> scan(ScanReport& report) const;

    [[nodiscard]] const ScanOptions& options() const { return options_; }

private:
    ScanOptions options_;
    std::shared_ptr<spdlog::logger> log_, digestLog_;

    [[nodiscard]] Entry classify(const std::string& dirName, const std::string& baseName, ScanReport& report) const;
    [[nodiscard]] std::optional<snapshot::model::FileRecord> record(const Entry& entry) const;
};

}

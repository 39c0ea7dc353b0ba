#pragma once

#include "snapshot/model/Import.hpp"
#include "snapshot/model/Policy.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace YAML {
class Node;
}

namespace fsnap::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum fsnap  = spdlog::level::info;   // command lifecycle
    spdlog::level::level_enum scan   = spdlog::level::info;   // walk progress, skipped entries
    spdlog::level::level_enum digest = spdlog::level::warn;
    spdlog::level::level_enum db     = spdlog::level::warn;   // failed transactions
    spdlog::level::level_enum diff   = spdlog::level::info;
    spdlog::level::level_enum config = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};   // console only when empty
    LogLevelsConfig levels;
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "fsnap";
    std::string user = "fsnap";
    std::string password_env = "FSNAP_DB_PASSWORD";
    std::string import_table = "fsnap_import";
    std::string file_record_table = "fsnap_file_record";
};

// Categories keep their document order; the first matching category wins.
using MatchPaths = std::vector<std::pair<std::string, std::vector<std::string>>>;

struct SnapshotSpec {
    std::string name;
    std::filesystem::path root_dir;
    MatchPaths match_paths;
    bool digest = true;
    bool compare_digests = true;
    bool multithread = true;
    snapshot::model::Tags tags;
    snapshot::model::ArchivedBy archived_by = snapshot::model::NotArchived{};
    snapshot::model::CalcBy file_group_by = snapshot::model::NoCalc{};
    snapshot::model::CalcBy file_type_by = snapshot::model::NoCalc{};
};

struct Config {
    LoggingConfig logging;
    DatabaseConfig database;
    std::map<std::string, SnapshotSpec> specs;

    // Throws ConfigError listing the known spec names.
    [[nodiscard]] const SnapshotSpec& spec(const std::string& name) const;
};

// Throws ConfigError on malformed documents.
Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::filesystem::path& path);

// The resolved spec as a YAML document
std::string dumpSpec(const SnapshotSpec& spec);

}

#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fsnap::config;
using namespace fsnap::snapshot::model;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["fsnap"]  = to_std_string(spdlog::level::to_string_view(rhs.fsnap));
        node["scan"]   = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["digest"] = to_std_string(spdlog::level::to_string_view(rhs.digest));
        node["db"]     = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["diff"]   = to_std_string(spdlog::level::to_string_view(rhs.diff));
        node["config"] = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.fsnap = spdlog::level::from_str(node["fsnap"].as<std::string>("info"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("info"));
        rhs.digest = spdlog::level::from_str(node["digest"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("warn"));
        rhs.diff = spdlog::level::from_str(node["diff"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        if (!rhs.log_dir.empty()) node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password_env"] = rhs.password_env;
        node["import_table"] = rhs.import_table;
        node["file_record_table"] = rhs.file_record_table;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("fsnap");
        rhs.user = node["user"].as<std::string>("fsnap");
        rhs.password_env = node["password_env"].as<std::string>("FSNAP_DB_PASSWORD");
        rhs.import_table = node["import_table"].as<std::string>("fsnap_import");
        rhs.file_record_table = node["file_record_table"].as<std::string>("fsnap_file_record");
        return true;
    }
};

// === ArchivedBy ===
// archived_by: { has_metadata: { key: archive, values: [archive, archived] } }
template<>
struct convert<ArchivedBy> {
    static Node encode(const ArchivedBy& rhs) {
        Node node(NodeType::Null);
        if (const auto* h = std::get_if<HasMetadata>(&rhs)) {
            node["has_metadata"]["key"] = h->key;
            Node values(NodeType::Sequence);
            for (const auto& v : h->values) values.push_back(v);
            node["has_metadata"]["values"] = values;
        }
        return node;
    }

    static bool decode(const Node& node, ArchivedBy& rhs) {
        if (node.IsNull()) {
            rhs = NotArchived{};
            return true;
        }
        if (!node.IsMap() || !node["has_metadata"] || !node["has_metadata"].IsMap()) return false;

        const auto& h = node["has_metadata"];
        if (!h["key"]) return false;

        HasMetadata rule{h["key"].as<std::string>(), {}};
        if (h["values"]) {
            if (!h["values"].IsSequence()) return false;
            for (const auto& v : h["values"]) rule.values.insert(v.as<std::string>());
        }
        rhs = std::move(rule);
        return true;
    }
};

// === CalcBy ===
// file_group_by: { from_metadata: "{protocol} // {account}" }
template<>
struct convert<CalcBy> {
    static Node encode(const CalcBy& rhs) {
        Node node(NodeType::Null);
        if (const auto* f = std::get_if<FromMetadata>(&rhs)) node["from_metadata"] = f->format;
        return node;
    }

    static bool decode(const Node& node, CalcBy& rhs) {
        if (node.IsNull()) {
            rhs = NoCalc{};
            return true;
        }
        if (!node.IsMap() || !node["from_metadata"] || !node["from_metadata"].IsScalar()) return false;
        rhs = FromMetadata{node["from_metadata"].as<std::string>()};
        return true;
    }
};

template<>
struct convert<SnapshotSpec> {
    static Node encode(const SnapshotSpec& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["root_dir"] = rhs.root_dir.string();

        Node paths(NodeType::Map);
        for (const auto& [category, patterns] : rhs.match_paths) paths[category] = patterns;
        node["match_paths"] = paths;

        node["digest"] = rhs.digest;
        node["compare_digests"] = rhs.compare_digests;
        node["multithread"] = rhs.multithread;
        node["tags"] = rhs.tags;
        node["archived_by"] = rhs.archived_by;
        node["file_group_by"] = rhs.file_group_by;
        node["file_type_by"] = rhs.file_type_by;
        return node;
    }

    static bool decode(const Node& node, SnapshotSpec& rhs) {
        if (!node.IsMap() || !node["root_dir"]) return false;
        rhs.name = node["name"].as<std::string>("");
        rhs.root_dir = node["root_dir"].as<std::string>();

        rhs.match_paths.clear();
        if (const auto& paths = node["match_paths"]) {
            if (!paths.IsMap()) return false;
            for (const auto& it : paths)
                rhs.match_paths.emplace_back(it.first.as<std::string>(), it.second.as<std::vector<std::string>>());
        }

        rhs.digest = node["digest"].as<bool>(true);
        rhs.compare_digests = node["compare_digests"].as<bool>(rhs.digest);
        rhs.multithread = node["multithread"].as<bool>(true);
        rhs.tags = node["tags"] ? normalizeTags(node["tags"].as<Tags>()) : Tags{};
        rhs.archived_by = node["archived_by"] ? node["archived_by"].as<ArchivedBy>() : ArchivedBy{NotArchived{}};
        rhs.file_group_by = node["file_group_by"] ? node["file_group_by"].as<CalcBy>() : CalcBy{NoCalc{}};
        rhs.file_type_by = node["file_type_by"] ? node["file_type_by"].as<CalcBy>() : CalcBy{NoCalc{}};
        return true;
    }
};

}

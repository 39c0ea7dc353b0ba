#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace fsnap::config {

template <typename T> T decodeSection(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid '" + key + "' section: " + e.what());
    } catch (const TagFormatError& e) {
        throw ConfigError("Invalid '" + key + "' section: " + e.what());
    }
}

Config parseConfig(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw ConfigError("Configuration root must be a mapping");

    if (auto node = root["logging"]) cfg.logging = decodeSection<LoggingConfig>(node, "logging");
    if (auto node = root["database"]) cfg.database = decodeSection<DatabaseConfig>(node, "database");

    if (auto node = root["specs"]) {
        if (!node.IsMap()) throw ConfigError("Invalid 'specs' section: expected a mapping");

        for (const auto& it : node) {
            const auto key = it.first.as<std::string>();
            auto spec = decodeSection<SnapshotSpec>(it.second, "specs." + key);
            if (spec.name.empty()) spec.name = key;

            if (spec.compare_digests && !spec.digest)
                throw ConfigError("Invalid 'specs." + key + "': compare_digests requires digest: true");

            for (const auto& [field, policy] : {std::pair{"file_group_by", &spec.file_group_by},
                                                std::pair{"file_type_by", &spec.file_type_by}}) {
                try {
                    snapshot::model::validate(*policy);
                } catch (const fmt::format_error& e) {
                    throw ConfigError("Invalid 'specs." + key + "." + field + "' format: " + e.what());
                }
            }

            cfg.specs.emplace(key, std::move(spec));
        }
    }

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load configuration " + path.string() + ": " + e.what());
    }
    return parseConfig(root);
}

const SnapshotSpec& Config::spec(const std::string& name) const {
    if (const auto it = specs.find(name); it != specs.end()) return it->second;

    std::string known;
    for (const auto& [k, _] : specs) known += (known.empty() ? "" : ", ") + k;
    throw ConfigError("Unknown spec '" + name + "' (available: " + (known.empty() ? "none" : known) + ")");
}

std::string dumpSpec(const SnapshotSpec& spec) {
    YAML::Emitter out;
    out << YAML::convert<SnapshotSpec>::encode(spec);
    return {out.c_str()};
}

}

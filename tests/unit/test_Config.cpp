#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "util/errors.hpp"

#include <sstream>
#include <yaml-cpp/yaml.h>

using namespace fsnap;
using namespace fsnap::config;
using namespace fsnap::snapshot::model;

TEST(ConfigTest, DecodesAFullDocument) {
    const auto cfg = parseConfig(YAML::Load(R"(
logging:
  log_dir: /tmp/fsnap-logs
  levels:
    console_log_level: warn
    subsystem_levels: { scan: debug, db: error }
database:
  host: db.example
  port: 6543
  import_table: imports
specs:
  delivery:
    root_dir: /data/delivery
    match_paths:
      results: [ "{protocol}/results/*.csv" ]
      archive: [ "{protocol}/{archive}/**", "old/**" ]
    digest: true
    compare_digests: true
    multithread: false
    tags: { Study: X }
    archived_by: { has_metadata: { key: archive, values: [archive, archived] } }
    file_group_by: { from_metadata: "{protocol}" }
)"));

    EXPECT_EQ(cfg.logging.log_dir, "/tmp/fsnap-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.scan, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::err);
    EXPECT_EQ(cfg.database.host, "db.example");
    EXPECT_EQ(cfg.database.port, 6543);
    EXPECT_EQ(cfg.database.import_table, "imports");
    EXPECT_EQ(cfg.database.file_record_table, "fsnap_file_record");

    const auto& spec = cfg.spec("delivery");
    EXPECT_EQ(spec.name, "delivery");
    EXPECT_EQ(spec.root_dir, "/data/delivery");
    ASSERT_EQ(spec.match_paths.size(), 2u);
    EXPECT_EQ(spec.match_paths[0].first, "results");
    EXPECT_EQ(spec.match_paths[1].first, "archive");
    EXPECT_EQ(spec.match_paths[1].second.size(), 2u);
    EXPECT_FALSE(spec.multithread);
    EXPECT_EQ(spec.tags.at("study"), "X");

    const auto& archived = std::get<HasMetadata>(spec.archived_by);
    EXPECT_EQ(archived.key, "archive");
    EXPECT_EQ(archived.values, (std::set<std::string>{"archive", "archived"}));
    EXPECT_EQ(std::get<FromMetadata>(spec.file_group_by).format, "{protocol}");
    EXPECT_TRUE(std::holds_alternative<NoCalc>(spec.file_type_by));
}

TEST(ConfigTest, CategoryOrderFollowsTheDocument) {
    const auto cfg = parseConfig(YAML::Load(R"(
specs:
  s:
    root_dir: /r
    match_paths:
      zeta: [ "z/*" ]
      alpha: [ "a/*" ]
      mid: [ "m/*" ]
)"));
    const auto& paths = cfg.spec("s").match_paths;
    ASSERT_EQ(paths.size(), 3u);
    EXPECT_EQ(paths[0].first, "zeta");
    EXPECT_EQ(paths[1].first, "alpha");
    EXPECT_EQ(paths[2].first, "mid");
}

TEST(ConfigTest, ExplicitNameOverridesKey) {
    const auto cfg = parseConfig(YAML::Load("specs: { s: { name: lineage, root_dir: /r } }"));
    EXPECT_EQ(cfg.spec("s").name, "lineage");
}

TEST(ConfigTest, UnknownSpecListsAvailable) {
    const auto cfg = parseConfig(YAML::Load("specs: { a: { root_dir: /r }, b: { root_dir: /r } }"));
    try {
        (void)cfg.spec("c");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("a, b"), std::string::npos);
    }
}

TEST(ConfigTest, CompareDigestsRequiresDigest) {
    EXPECT_THROW(parseConfig(YAML::Load("specs: { s: { root_dir: /r, digest: false, compare_digests: true } }")),
                 ConfigError);
    EXPECT_NO_THROW(parseConfig(YAML::Load("specs: { s: { root_dir: /r, digest: false } }")));
}

TEST(ConfigTest, MalformedSectionsAreConfigErrors) {
    EXPECT_THROW(parseConfig(YAML::Load("specs: { s: { match_paths: {} } }")), ConfigError);
    EXPECT_THROW(parseConfig(YAML::Load("specs: { s: { root_dir: /r, archived_by: { nonsense: 1 } } }")),
                 ConfigError);
    EXPECT_THROW(parseConfig(YAML::Load("database: [1, 2]")), ConfigError);
    EXPECT_THROW(parseConfig(YAML::Load("- just\n- a list\n")), ConfigError);
}

TEST(ConfigTest, MalformedPolicyFormatIsRejectedNamingTheKey) {
    try {
        parseConfig(YAML::Load(R"(
specs:
  s:
    root_dir: /r
    file_group_by:
      from_metadata: "{protocol"
)"));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("specs.s.file_group_by"), std::string::npos);
    }

    EXPECT_THROW(parseConfig(YAML::Load(R"(
specs:
  s:
    root_dir: /r
    file_type_by:
      from_metadata: "{kind:Q}"
)")),
                 ConfigError);
}

TEST(ConfigTest, CollidingTagKeysAreConfigErrors) {
    EXPECT_THROW(parseConfig(YAML::Load("specs: { s: { root_dir: /r, tags: { Site: a, site: b } } }")), ConfigError);
}

TEST(ConfigTest, DumpedSpecParsesBack) {
    const auto cfg = parseConfig(YAML::Load(R"(
specs:
  s:
    root_dir: /r
    match_paths: { results: [ "{p}/*.csv" ] }
    archived_by: { has_metadata: { key: archive } }
    file_type_by: { from_metadata: "{p}" }
)"));

    const auto dumped = dumpSpec(cfg.spec("s"));
    const auto again = parseConfig(YAML::Load("specs:\n  s:\n" + [&] {
        std::string indented;
        std::istringstream in(dumped);
        for (std::string line; std::getline(in, line);) indented += "    " + line + "\n";
        return indented;
    }()));

    const auto& a = cfg.spec("s");
    const auto& b = again.spec("s");
    EXPECT_EQ(a.name, b.name);
    EXPECT_EQ(a.root_dir, b.root_dir);
    EXPECT_EQ(a.match_paths, b.match_paths);
    EXPECT_EQ(std::get<HasMetadata>(b.archived_by).key, "archive");
    EXPECT_EQ(std::get<FromMetadata>(b.file_type_by).format, "{p}");
}

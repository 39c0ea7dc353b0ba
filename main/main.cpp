#include "cmd/commands.hpp"
#include "config/Config.hpp"
#include "db/MemoryStore.hpp"
#include "db/PgStore.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace fsnap;

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_NOT_FOUND = 3;
constexpr int EXIT_NO_NEWER_VERSION = 4;

void usage() {
    std::cerr << "usage: fsnap [-c <config.yaml>] <command> [args...]\n"
                 "\n"
                 "commands:\n"
                 "  store <spec> [--memory]   scan the spec's root and record a new import\n"
                 "                            (--memory: dry run, nothing is persisted and the\n"
                 "                            printed id cannot be diffed later)\n"
                 "  diff <spec> <import-id>   diff an import against the latest of its lineage\n"
                 "  config <spec>             print the resolved spec\n";
}

db::StoreFactory storeFactory(const config::Config& cfg, const bool memory) {
    if (memory) {
        auto shared = std::make_shared<db::MemoryStore>(log::Registry::db());
        return [shared] { return shared; };
    }
    return [dbCfg = cfg.database] { return std::make_shared<db::PgStore>(dbCfg, log::Registry::db()); };
}

int run(const std::vector<std::string>& args, const std::string& configPath) {
    const auto cfg = config::loadConfig(configPath);
    log::Registry::init(cfg.logging);

    if (args.size() < 2) {
        usage();
        return EXIT_USAGE;
    }

    const auto& command = args[0];
    const auto& spec = cfg.spec(args[1]);

    if (command == "store") {
        const bool memory = args.size() > 2 && args[2] == "--memory";
        if (memory) log::Registry::fsnap()->warn("[main] Dry run: import '{}' is kept in memory only", spec.name);
        const auto result = cmd::store(spec, storeFactory(cfg, memory));
        std::cout << snapshot::model::toHex(result.id) << std::endl;
        return 0;
    }

    if (command == "diff") {
        if (args.size() < 3) {
            usage();
            return EXIT_USAGE;
        }

        snapshot::model::ImportId id;
        try {
            id = snapshot::model::parseImportId(args[2]);
        } catch (const std::invalid_argument& e) {
            std::cerr << "fsnap: " << e.what() << std::endl;
            return EXIT_USAGE;
        }

        const auto store = storeFactory(cfg, false)();
        std::cout << cmd::diff(spec, *store, id).dump(2) << std::endl;
        return 0;
    }

    if (command == "config") {
        std::cout << config::dumpSpec(spec) << std::endl;
        return 0;
    }

    usage();
    return EXIT_USAGE;
}

void report(const std::exception& e) {
    if (log::Registry::isInitialized()) log::Registry::fsnap()->error("[main] {}", e.what());
    std::cerr << "fsnap: " << e.what() << std::endl;
}

}

int main(int argc, char** argv) {
    std::string configPath = "fsnap.yaml";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage();
            return 0;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                usage();
                return EXIT_USAGE;
            }
            configPath = argv[++i];
            continue;
        }
        args.push_back(arg);
    }

    if (args.empty()) {
        usage();
        return EXIT_USAGE;
    }

    int rc;
    try {
        rc = run(args, configPath);
    } catch (const NotFoundError& e) {
        report(e);
        rc = EXIT_NOT_FOUND;
    } catch (const NoNewerVersionError& e) {
        report(e);
        rc = EXIT_NO_NEWER_VERSION;
    } catch (const std::exception& e) {
        report(e);
        rc = 1;
    }

    log::Registry::shutdown();
    return rc;
}

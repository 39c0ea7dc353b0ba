#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <vector>

using namespace fsnap::log;

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = cnf.log_dir;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    if (!log_dir_.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (log_dir_ / "fsnap.log").string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);

        // store statements get a file of their own
        db_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (log_dir_ / "fsnap-db.log").string(), main_max_bytes_, main_max_files_);
        db_file_sink_->set_level(cnf.levels.file_log_level);
        db_file_sink_->set_pattern(LOG_FORMAT);
    }

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl,
                          const std::shared_ptr<spdlog::sinks::sink>& fileSink) {
        std::vector<spdlog::sink_ptr> sinks{console_sink_};
        if (fileSink) sinks.push_back(fileSink);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub = cnf.levels.subsystem_levels;
    makeLogger("fsnap",  sub.fsnap,  main_file_sink_);
    makeLogger("scan",   sub.scan,   main_file_sink_);
    makeLogger("digest", sub.digest, main_file_sink_);
    makeLogger("db",     sub.db,     db_file_sink_);
    makeLogger("diff",   sub.diff,   main_file_sink_);
    makeLogger("config", sub.config, main_file_sink_);

    initialized_ = true;
    fsnap()->debug("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    db_file_sink_.reset();
    initialized_ = false;
}

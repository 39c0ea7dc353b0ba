#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace fsnap::config {
struct LoggingConfig;
}

namespace fsnap::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> fsnap()   { return get("fsnap"); }
    static std::shared_ptr<spdlog::logger> scan()    { return get("scan"); }
    static std::shared_ptr<spdlog::logger> digest()  { return get("digest"); }
    static std::shared_ptr<spdlog::logger> db()      { return get("db"); }
    static std::shared_ptr<spdlog::logger> diff()    { return get("diff"); }
    static std::shared_ptr<spdlog::logger> config()  { return get("config"); }

    [[nodiscard]] static bool isInitialized();

    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%t] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> db_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}

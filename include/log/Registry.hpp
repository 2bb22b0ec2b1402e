#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace loft::config {
struct LoggingConfig;
}

namespace loft::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels from the loaded config.
    static void init();
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> loft()    { return get("loft"); }
    static std::shared_ptr<spdlog::logger> http()    { return get("http"); }
    static std::shared_ptr<spdlog::logger> auth()    { return get("auth"); }
    static std::shared_ptr<spdlog::logger> remote()  { return get("remote"); }
    static std::shared_ptr<spdlog::logger> upload()  { return get("upload"); }
    static std::shared_ptr<spdlog::logger> cache()   { return get("cache"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("fs"); }
    static std::shared_ptr<spdlog::logger> events()  { return get("events"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // shared by every subsystem logger
    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace loft::config {

constexpr static unsigned int DEFAULT_REFRESH_GRACE_SECONDS = 5 * 60;

struct ApiConfig {
    std::string base_url{};
    unsigned int request_timeout_seconds = 0; // 0 = no overall deadline
    unsigned int connect_timeout_seconds = 15;
    std::string user_agent = "loft/1.0";
};

struct AuthConfig {
    std::string username{};
    std::string password{};
    std::string two_factor_code{};
    unsigned int refresh_grace_seconds = DEFAULT_REFRESH_GRACE_SECONDS;
};

struct CacheConfig {
    bool enabled = true;
    std::filesystem::path directory{};
};

struct ScratchConfig {
    std::filesystem::path directory{};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum loft   = spdlog::level::info;   // Startup, command results
    spdlog::level::level_enum http   = spdlog::level::warn;   // Transport failures only
    spdlog::level::level_enum auth   = spdlog::level::info;   // Logins, refreshes, token errors
    spdlog::level::level_enum remote = spdlog::level::info;   // Non-success API responses
    spdlog::level::level_enum upload = spdlog::level::info;   // Chunk progress and failures
    spdlog::level::level_enum cache  = spdlog::level::info;   // Cache population and eviction
    spdlog::level::level_enum fs     = spdlog::level::info;   // Filesystem operations
    spdlog::level::level_enum events = spdlog::level::info;   // Inbound change notifications
};

struct LoggingConfig {
    std::filesystem::path log_dir{};
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    ApiConfig api;
    AuthConfig auth;
    CacheConfig cache;
    ScratchConfig scratch;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path cacheDirectory() const;
    [[nodiscard]] std::filesystem::path scratchDirectory() const;

    void save(const std::filesystem::path& path) const;
};

Config loadConfig(const std::filesystem::path& path);

}

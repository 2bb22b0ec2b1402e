#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace loft::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum level_or(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<ApiConfig> {
    static Node encode(const ApiConfig& rhs) {
        Node node;
        node["base_url"] = rhs.base_url;
        node["request_timeout_seconds"] = rhs.request_timeout_seconds;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["user_agent"] = rhs.user_agent;
        return node;
    }

    static bool decode(const Node& node, ApiConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_url = node["base_url"].as<std::string>("");
        rhs.request_timeout_seconds = node["request_timeout_seconds"].as<unsigned int>(0);
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(15);
        rhs.user_agent = node["user_agent"].as<std::string>("loft/1.0");
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static Node encode(const AuthConfig& rhs) {
        Node node;
        node["username"] = rhs.username;
        node["refresh_grace_seconds"] = rhs.refresh_grace_seconds;
        return node;
    }

    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.username = node["username"].as<std::string>("");
        rhs.password = node["password"].as<std::string>("");
        rhs.two_factor_code = node["two_factor_code"].as<std::string>("");
        rhs.refresh_grace_seconds = node["refresh_grace_seconds"].as<unsigned int>(DEFAULT_REFRESH_GRACE_SECONDS);
        return true;
    }
};

template<>
struct convert<CacheConfig> {
    static Node encode(const CacheConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["directory"] = rhs.directory.string();
        return node;
    }

    static bool decode(const Node& node, CacheConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.directory = node["directory"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<ScratchConfig> {
    static Node encode(const ScratchConfig& rhs) {
        Node node;
        node["directory"] = rhs.directory.string();
        return node;
    }

    static bool decode(const Node& node, ScratchConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.directory = node["directory"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["loft"]   = to_std_string(spdlog::level::to_string_view(rhs.loft));
        node["http"]   = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["auth"]   = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["remote"] = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["upload"] = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["cache"]  = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["fs"]     = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["events"] = to_std_string(spdlog::level::to_string_view(rhs.events));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.loft   = level_or(node["loft"], def.loft);
        rhs.http   = level_or(node["http"], def.http);
        rhs.auth   = level_or(node["auth"], def.auth);
        rhs.remote = level_or(node["remote"], def.remote);
        rhs.upload = level_or(node["upload"], def.upload);
        rhs.cache  = level_or(node["cache"], def.cache);
        rhs.fs     = level_or(node["fs"], def.fs);
        rhs.events = level_or(node["events"], def.events);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.console_log_level = level_or(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = level_or(node["file_log_level"], spdlog::level::debug);
        if (const auto levels = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(levels, rhs.subsystem_levels);
        return true;
    }
};

}

#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace loft::config {

namespace fs = std::filesystem;

static fs::path expandHome(const fs::path& p) {
    const auto s = p.string();
    if (s.empty() || s.front() != '~') return p;
    const char* home = std::getenv("HOME");
    if (!home) return p;
    return fs::path(home) / s.substr(s.size() > 1 && s[1] == '/' ? 2 : 1);
}

Config loadConfig(const fs::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["api"]) YAML::convert<ApiConfig>::decode(node, cfg.api);
    if (auto node = root["auth"]) YAML::convert<AuthConfig>::decode(node, cfg.auth);
    if (auto node = root["cache"]) YAML::convert<CacheConfig>::decode(node, cfg.cache);
    if (auto node = root["scratch"]) YAML::convert<ScratchConfig>::decode(node, cfg.scratch);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    cfg.cache.directory = expandHome(cfg.cache.directory);
    cfg.scratch.directory = expandHome(cfg.scratch.directory);
    cfg.logging.log_dir = expandHome(cfg.logging.log_dir);

    if (const char* password = std::getenv("LOFT_PASSWORD")) cfg.auth.password = password;

    return cfg;
}

fs::path Config::cacheDirectory() const {
    if (!cache.directory.empty()) return cache.directory;
    if (const char* xdg = std::getenv("XDG_CACHE_HOME")) return fs::path(xdg) / "loft";
    if (const char* home = std::getenv("HOME")) return fs::path(home) / ".cache" / "loft";
    return fs::temp_directory_path() / "loft-cache";
}

fs::path Config::scratchDirectory() const {
    if (!scratch.directory.empty()) return scratch.directory;
    return fs::temp_directory_path() / "loft-scratch";
}

void Config::save(const fs::path& path) const {
    YAML::Node root;
    root["api"] = api;
    root["auth"] = auth;
    root["cache"] = cache;
    root["scratch"] = scratch;
    root["logging"] = logging;

    YAML::Emitter out;
    out << root;

    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream file(path);
    if (!file.is_open()) throw std::runtime_error("Failed to write config file: " + path.string());
    file << out.c_str() << '\n';
}

}

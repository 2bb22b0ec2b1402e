#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace loft::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = std::filesystem::exists(path) ? loadConfig(path) : Config{};
        initialized_ = true;
    });
}

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&]() {
        config_ = config;
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

std::filesystem::path ConfigRegistry::defaultPath() {
    if (const char* env = std::getenv("LOFT_CONFIG")) return env;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) return std::filesystem::path(xdg) / "loft" / "config.yaml";
    if (const char* home = std::getenv("HOME")) return std::filesystem::path(home) / ".config" / "loft" / "config.yaml";
    return "config.yaml";
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace loft::config

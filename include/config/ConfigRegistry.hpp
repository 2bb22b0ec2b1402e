#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace loft::config {

class ConfigRegistry {
public:
    // Loads the file when it exists, defaults otherwise.
    static void init(const std::filesystem::path& path);
    static void init(const Config& config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

    /// LOFT_CONFIG, then $XDG_CONFIG_HOME/loft/config.yaml, then ~/.config/loft/config.yaml
    [[nodiscard]] static std::filesystem::path defaultPath();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace loft::config

#pragma once

#include <memory>

namespace loft::config { struct Config; }
namespace loft::http { class Transport; }
namespace loft::auth { class TokenManager; }
namespace loft::remote { class Client; }
namespace loft::cache { class ReadThroughCache; }
namespace loft::fs { class Filesystem; }

namespace loft::runtime {

/// The object graph one process works with, wired from configuration.
struct Deps {
    std::shared_ptr<http::Transport> transport;
    std::shared_ptr<auth::TokenManager> tokens;
    std::shared_ptr<remote::Client> client;
    std::shared_ptr<cache::ReadThroughCache> cache;
    std::shared_ptr<fs::Filesystem> filesystem;

    /// A null transport means libcurl with the configured timeouts.
    static Deps build(const config::Config& cfg, std::shared_ptr<http::Transport> transport = nullptr);

    /// Logs in with the configured credentials.
    void authenticate(const config::Config& cfg) const;
};

}

#include "runtime/Deps.hpp"
#include "auth/TokenManager.hpp"
#include "cache/ReadThroughCache.hpp"
#include "config/Config.hpp"
#include "fs/Filesystem.hpp"
#include "http/CurlTransport.hpp"
#include "remote/Client.hpp"
#include "log/Registry.hpp"

namespace loft::runtime {

Deps Deps::build(const config::Config& cfg, std::shared_ptr<http::Transport> transport) {
    if (cfg.api.base_url.empty()) throw std::runtime_error("api.base_url is not configured");

    Deps d;
    d.transport = transport ? std::move(transport)
                            : std::make_shared<http::CurlTransport>(http::CurlOptions{
                                  .connect_timeout_seconds = static_cast<long>(cfg.api.connect_timeout_seconds),
                                  .user_agent = cfg.api.user_agent,
                              });

    d.tokens = std::make_shared<auth::TokenManager>(
        d.transport, cfg.api.base_url,
        auth::TokenManagerOptions{
            .default_user = cfg.auth.username,
            .grace = std::chrono::seconds(cfg.auth.refresh_grace_seconds),
        });

    d.client = std::make_shared<remote::Client>(
        d.transport, cfg.api.base_url, d.tokens,
        remote::ClientOptions{.request_timeout = std::chrono::seconds(cfg.api.request_timeout_seconds)});

    if (cfg.cache.enabled) d.cache = std::make_shared<cache::ReadThroughCache>(cfg.cacheDirectory(), d.client);

    d.filesystem = std::make_shared<fs::Filesystem>(d.client, cfg.scratchDirectory(), d.cache);

    log::Registry::loft()->debug("[Deps] Wired client for {} (cache {})", cfg.api.base_url,
                                 d.cache ? d.cache->directory().string() : std::string("disabled"));
    return d;
}

void Deps::authenticate(const config::Config& cfg) const {
    if (cfg.auth.username.empty()) throw std::runtime_error("auth.username is not configured");
    tokens->authenticate(cfg.auth.username, cfg.auth.password, cfg.auth.two_factor_code);
}

}

#include "auth/TokenManager.hpp"
#include "remote/errors.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"
#include "util/url.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

using json = nlohmann::json;

namespace loft::auth {

using namespace remote;

namespace {
constexpr auto kAuthenticateEndpoint = "api/v1/auth/authenticate-user";
constexpr auto kRefreshEndpoint = "api/v1/auth/refresh-token";
}

TokenManager::TokenManager(std::shared_ptr<http::Transport> transport, std::string apiUrl)
    : TokenManager(std::move(transport), std::move(apiUrl), TokenManagerOptions{}) {}

TokenManager::TokenManager(std::shared_ptr<http::Transport> transport, std::string apiUrl,
                           TokenManagerOptions opts, std::shared_ptr<CredentialStore> store)
    : transport_(std::move(transport)), apiUrl_(std::move(apiUrl)), opts_(std::move(opts)),
      store_(store ? std::move(store) : std::make_shared<MemoryCredentialStore>()) {
    if (!transport_) throw std::invalid_argument("TokenManager requires a transport");
}

Credential TokenManager::exchange_(const std::string& endpoint, const std::string& body,
                                   const std::string& what, const http::CancelToken& cancel) const {
    http::Request req{
        .method = http::Method::Post,
        .url = util::joinUrl(apiUrl_, endpoint),
        .body = body,
    };
    req.setHeader("Content-Type", "application/json");

    const auto res = transport_->perform(req, cancel);

    if (res.status != 200) {
        const auto msg = fmt::format("{} failed: unexpected status code {}", what, res.status);
        if (endpoint == kAuthenticateEndpoint) throw AuthFailed(msg, res.status);
        throw UnexpectedStatus(msg, res.status);
    }

    try {
        return json::parse(res.body).get<Credential>();
    } catch (const std::exception& e) {
        throw DecodeError(fmt::format("failed to decode {} response: {}", what, e.what()));
    }
}

void TokenManager::authenticate(const std::string& username, const std::string& password,
                                const std::string& twoFactorCode, const http::CancelToken& cancel) {
    log::Registry::auth()->debug("[TokenManager] Authenticating user '{}'", username);

    std::scoped_lock lock(mutex_);

    const json body = {{"username", username}, {"password", password}, {"twoFactorCode", twoFactorCode}};
    auto credential = exchange_(kAuthenticateEndpoint, body.dump(), "authentication", cancel);
    if (credential.username.empty()) credential.username = username;

    store_->set(username, credential);
    lastUser_ = username;
    log::Registry::auth()->info("[TokenManager] Authenticated '{}', access token valid until {}",
                                username, util::formatRfc3339(credential.access_expires));
}

Credential TokenManager::refreshLocked_(const std::string& user, const Credential& current,
                                        const http::CancelToken& cancel) {
    const json body = {{"token", current.refresh_token}};
    auto credential = exchange_(kRefreshEndpoint, body.dump(), "token refresh", cancel);
    if (credential.username.empty()) credential.username = current.username;

    store_->set(user, credential);
    log::Registry::auth()->debug("[TokenManager] Refreshed access token for '{}'", user);
    return credential;
}

std::string TokenManager::defaultUser() const {
    std::scoped_lock lock(mutex_);
    return opts_.default_user.empty() ? lastUser_ : opts_.default_user;
}

std::string TokenManager::getToken(const http::CancelToken& cancel) {
    const auto user = defaultUser();
    if (user.empty()) throw NoToken("default");
    return getToken(user, cancel);
}

std::string TokenManager::getToken(const std::string& user, const http::CancelToken& cancel) {
    std::scoped_lock lock(mutex_);

    auto credential = store_->get(user);
    if (!credential || credential->access_token.empty()) {
        log::Registry::auth()->debug("[TokenManager] No token stored for '{}'", user);
        throw NoToken(user);
    }

    if (credential->refreshExpired()) {
        log::Registry::auth()->debug("[TokenManager] Refresh token for '{}' expired", user);
        throw RefreshExpired(user);
    }

    if (credential->accessExpiresWithin(opts_.grace)) {
        log::Registry::auth()->debug("[TokenManager] Access token for '{}' expires soon, refreshing", user);
        credential = refreshLocked_(user, *credential, cancel);
    }

    return credential->access_token;
}

void TokenManager::refresh(const std::string& user, const http::CancelToken& cancel) {
    std::scoped_lock lock(mutex_);

    const auto credential = store_->get(user);
    if (!credential) throw NoToken(user);
    if (credential->refreshExpired()) throw RefreshExpired(user);

    refreshLocked_(user, *credential, cancel);
}

void TokenManager::forget(const std::string& user) {
    std::scoped_lock lock(mutex_);
    store_->erase(user);
    if (lastUser_ == user) lastUser_.clear();
}

}

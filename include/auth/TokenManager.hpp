#pragma once

#include "auth/Credential.hpp"
#include "auth/CredentialStore.hpp"
#include "http/Transport.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace loft::auth {

struct TokenManagerOptions {
    /// Key used by getToken() without a user. Empty means the most recent authenticate().
    std::string default_user;
    std::chrono::seconds grace{300};
};

/// Hands out bearer tokens, refreshing them before they expire.
/// One mutex guards the store and every network exchange, so concurrent
/// getToken() calls trigger at most one refresh per expiry.
class TokenManager {
public:
    TokenManager(std::shared_ptr<http::Transport> transport, std::string apiUrl);
    TokenManager(std::shared_ptr<http::Transport> transport, std::string apiUrl, TokenManagerOptions opts,
                 std::shared_ptr<CredentialStore> store = nullptr);

    /// Throws remote::AuthFailed on any non-200 answer.
    void authenticate(const std::string& username, const std::string& password,
                      const std::string& twoFactorCode, const http::CancelToken& cancel = {});

    [[nodiscard]] std::string getToken(const http::CancelToken& cancel = {});
    [[nodiscard]] std::string getToken(const std::string& user, const http::CancelToken& cancel);

    void refresh(const std::string& user, const http::CancelToken& cancel = {});

    void forget(const std::string& user);

    [[nodiscard]] std::string defaultUser() const;
    [[nodiscard]] std::chrono::seconds grace() const { return opts_.grace; }

private:
    std::shared_ptr<http::Transport> transport_;
    std::string apiUrl_;
    TokenManagerOptions opts_;
    std::shared_ptr<CredentialStore> store_;
    std::string lastUser_;
    mutable std::mutex mutex_;

    Credential exchange_(const std::string& endpoint, const std::string& body,
                         const std::string& what, const http::CancelToken& cancel) const;

    Credential refreshLocked_(const std::string& user, const Credential& current, const http::CancelToken& cancel);
};

}

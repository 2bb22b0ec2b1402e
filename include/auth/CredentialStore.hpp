#pragma once

#include "auth/Credential.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace loft::auth {

/// Keyed by username. Implementations need not be thread-safe; TokenManager serializes access.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual void set(const std::string& username, const Credential& credential) = 0;

    /// std::nullopt when nothing is stored for the user.
    [[nodiscard]] virtual std::optional<Credential> get(const std::string& username) const = 0;

    virtual void erase(const std::string& username) = 0;
};

class MemoryCredentialStore final : public CredentialStore {
public:
    void set(const std::string& username, const Credential& credential) override;
    [[nodiscard]] std::optional<Credential> get(const std::string& username) const override;
    void erase(const std::string& username) override;

private:
    std::unordered_map<std::string, Credential> credentials_;
};

}

#include "auth/CredentialStore.hpp"

namespace loft::auth {

void MemoryCredentialStore::set(const std::string& username, const Credential& credential) {
    credentials_[username] = credential;
}

std::optional<Credential> MemoryCredentialStore::get(const std::string& username) const {
    const auto it = credentials_.find(username);
    if (it == credentials_.end()) return std::nullopt;
    return it->second;
}

void MemoryCredentialStore::erase(const std::string& username) {
    credentials_.erase(username);
}

}

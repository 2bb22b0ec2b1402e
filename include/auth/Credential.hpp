#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace loft::auth {

struct Credential {
    using clock = std::chrono::system_clock;

    std::string username;
    std::string access_token;
    clock::time_point access_expires{};
    std::string refresh_token;
    clock::time_point refresh_expires{};

    [[nodiscard]] bool refreshExpired(const clock::time_point now = clock::now()) const { return refresh_expires < now; }

    /// True when the access token expires inside [now, now + grace).
    [[nodiscard]] bool accessExpiresWithin(const std::chrono::seconds grace,
                                           const clock::time_point now = clock::now()) const {
        return access_expires < now + grace;
    }
};

void to_json(nlohmann::json& j, const Credential& c);
void from_json(const nlohmann::json& j, Credential& c);

}

#include "auth/Credential.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace loft::auth {

void to_json(nlohmann::json& j, const Credential& c) {
    j = {
        {"username", c.username},
        {"accessToken", c.access_token},
        {"accessTokenExpiration", util::formatRfc3339(c.access_expires)},
        {"refreshToken", c.refresh_token},
        {"refreshTokenExpiration", util::formatRfc3339(c.refresh_expires)}
    };
}

void from_json(const nlohmann::json& j, Credential& c) {
    c.username = j.value("username", std::string{});
    c.access_token = j.at("accessToken").get<std::string>();
    c.access_expires = util::parseRfc3339(j.at("accessTokenExpiration").get<std::string>());
    c.refresh_token = j.at("refreshToken").get<std::string>();
    c.refresh_expires = util::parseRfc3339(j.at("refreshTokenExpiration").get<std::string>());
}

}

#include "remote/model/FileLink.hpp"

#include <nlohmann/json.hpp>

namespace loft::remote::model {

void from_json(const nlohmann::json& j, FileLink& l) {
    l.short_link = j.value("shortLink", std::string{});
    l.public_link = j.value("publicLink", std::string{});
    l.is_public = j.value("isPublic", false);
}

}

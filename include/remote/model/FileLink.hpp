#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace loft::remote::model {

struct FileLink {
    std::string short_link;
    std::string public_link;
    bool is_public = false;
};

void from_json(const nlohmann::json& j, FileLink& l);

}

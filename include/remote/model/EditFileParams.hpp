#pragma once

#include <ctime>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace loft::remote::model {

struct EditFileParams {
    std::string password;
    bool published = false;
    std::time_t published_until = 0;
    std::string short_link;
    std::string public_download_link;
};

void to_json(nlohmann::json& j, const EditFileParams& p);

}

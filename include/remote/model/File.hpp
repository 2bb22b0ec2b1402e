#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace loft::remote::model {

struct File {
    std::string id;
    std::string name;
    std::string type;
    uint64_t size = 0;
    std::time_t date_added = 0;
    std::string folder_path;
};

void to_json(nlohmann::json& j, const File& f);
void from_json(const nlohmann::json& j, File& f);

}

#include "remote/model/File.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace loft::remote::model {

void to_json(nlohmann::json& j, const File& f) {
    j = {
        {"id", f.id},
        {"fileName", f.name},
        {"type", f.type},
        {"size", f.size},
        {"dateAdded", util::timestampToString(f.date_added)},
        {"folderPath", f.folder_path}
    };
}

void from_json(const nlohmann::json& j, File& f) {
    f.id = j.at("id").get<std::string>();
    f.name = j.value("fileName", std::string{});
    f.type = j.value("type", std::string{});
    f.size = j.value("size", uint64_t{0});
    f.folder_path = j.value("folderPath", std::string{});

    f.date_added = 0;
    if (j.contains("dateAdded") && j["dateAdded"].is_string())
        f.date_added = std::chrono::system_clock::to_time_t(util::parseRfc3339(j["dateAdded"].get<std::string>()));
}

}

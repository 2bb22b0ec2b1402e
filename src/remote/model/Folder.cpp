#include "remote/model/Folder.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace loft::remote::model {

static void flattenInto(const Folder& f, std::vector<Folder>& out) {
    out.push_back(f);
    for (const auto& sub : f.subfolders) flattenInto(sub, out);
}

std::vector<Folder> Folder::flatten() const {
    std::vector<Folder> out;
    flattenInto(*this, out);
    return out;
}

const Folder* Folder::subfolder(const std::string_view childName) const {
    const auto it = std::ranges::find_if(subfolders, [&](const Folder& f) { return f.name == childName; });
    return it == subfolders.end() ? nullptr : &*it;
}

const File* Folder::file(const std::string_view fileName) const {
    const auto it = std::ranges::find_if(files, [&](const File& f) { return f.name == fileName; });
    return it == files.end() ? nullptr : &*it;
}

void to_json(nlohmann::json& j, const Folder& f) {
    j = {
        {"name", f.name},
        {"path", f.path},
        {"size", f.size},
        {"version", f.version},
        {"count", f.count},
        {"subfolders", f.subfolders},
        {"files", f.files}
    };
}

void from_json(const nlohmann::json& j, Folder& f) {
    f.name = j.value("name", std::string{});
    f.path = j.value("path", std::string{});
    f.size = j.value("size", uint64_t{0});
    f.count = j.value("count", 0u);

    f.version.clear();
    if (j.contains("version")) {
        const auto& v = j["version"];
        if (v.is_string()) f.version = v.get<std::string>();
        else if (!v.is_null()) f.version = v.dump();
    }

    f.subfolders.clear();
    if (j.contains("subfolders") && j["subfolders"].is_array())
        f.subfolders = j["subfolders"].get<std::vector<Folder>>();

    f.files.clear();
    if (j.contains("files") && j["files"].is_array())
        f.files = j["files"].get<std::vector<File>>();
}

}

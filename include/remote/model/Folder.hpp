#pragma once

#include "remote/model/File.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace loft::remote::model {

/// A full subtree snapshot as returned by the folder endpoints.
struct Folder {
    std::string name;
    std::string path;
    uint64_t size = 0;
    std::string version;
    unsigned int count = 0;
    std::vector<Folder> subfolders;
    std::vector<File> files;

    /// Pre-order: this folder, then each subfolder's subtree in order.
    [[nodiscard]] std::vector<Folder> flatten() const;

    [[nodiscard]] const Folder* subfolder(std::string_view childName) const;
    [[nodiscard]] const File* file(std::string_view fileName) const;
};

void to_json(nlohmann::json& j, const Folder& f);
void from_json(const nlohmann::json& j, Folder& f);

}

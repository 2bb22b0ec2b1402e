#pragma once

#include "remote/model/File.hpp"
#include "remote/model/Folder.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <sys/stat.h>

namespace loft::fs {

struct FileInfo {
    std::string name;
    std::string id; // empty for folders
    uint64_t size = 0;
    mode_t mode = 0;
    std::time_t mtime = 0;

    [[nodiscard]] bool isDir() const { return S_ISDIR(mode); }
    [[nodiscard]] bool isRegular() const { return S_ISREG(mode); }

    static FileInfo of(const remote::model::File& f);
    static FileInfo of(const remote::model::Folder& f);
};

}

#include "fs/FileInfo.hpp"

namespace loft::fs {

FileInfo FileInfo::of(const remote::model::File& f) {
    return {
        .name = f.name,
        .id = f.id,
        .size = f.size,
        .mode = static_cast<mode_t>(0644 | S_IFREG),
        .mtime = f.date_added,
    };
}

// Folder records carry no timestamp.
FileInfo FileInfo::of(const remote::model::Folder& f) {
    return {
        .name = f.name.empty() && f.path == "/" ? "/" : f.name,
        .size = f.size,
        .mode = static_cast<mode_t>(0755 | S_IFDIR),
        .mtime = std::time(nullptr),
    };
}

}

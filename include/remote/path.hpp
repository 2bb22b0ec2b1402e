#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace loft::remote {

struct PathParts {
    std::string parent; // always absolute, "/" for top-level entries
    std::string leaf;   // empty for the root itself

    bool operator==(const PathParts&) const = default;
};

/// "/some/full/path" -> {"/some/full", "path"}; "/x" -> {"/", "x"}; "/" -> {"/", ""}.
/// Leading and trailing slashes are ignored.
PathParts parsePath(std::string_view path);

/// Non-empty segments of a slash-delimited path.
std::vector<std::string> splitPath(std::string_view path);

/// joinPath("/", "a") == "/a", joinPath("/a", "b") == "/a/b"
std::string joinPath(std::string_view parent, std::string_view leaf);

[[nodiscard]] inline bool isRoot(const std::string_view path) {
    return path.find_first_not_of('/') == std::string_view::npos;
}

}

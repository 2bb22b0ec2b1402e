#include "remote/path.hpp"

namespace loft::remote {

std::vector<std::string> splitPath(std::string_view path) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= path.size()) {
        const auto end = path.find('/', start);
        const auto seg = path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (!seg.empty()) out.emplace_back(seg);
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return out;
}

PathParts parsePath(const std::string_view path) {
    const auto first = path.find_first_not_of('/');
    if (first == std::string_view::npos) return {"/", ""};

    const auto last = path.find_last_not_of('/');
    const auto trimmed = path.substr(first, last - first + 1);

    const auto slash = trimmed.rfind('/');
    if (slash == std::string_view::npos) return {"/", std::string(trimmed)};

    return {"/" + std::string(trimmed.substr(0, slash)), std::string(trimmed.substr(slash + 1))};
}

std::string joinPath(const std::string_view parent, const std::string_view leaf) {
    std::string out(parent.empty() ? "/" : parent);
    if (leaf.empty()) return out;
    if (out.back() != '/') out += '/';
    out += leaf;
    return out;
}

}

#pragma once

#include <string>
#include <string_view>

namespace loft::util {

/// "https://host/" + "/api/x" -> "https://host/api/x"
inline std::string joinUrl(std::string_view base, std::string_view path) {
    while (!base.empty() && base.back() == '/') base.remove_suffix(1);
    while (!path.empty() && path.front() == '/') path.remove_prefix(1);
    std::string out(base);
    out += '/';
    out += path;
    return out;
}

/// Replaces every "{key}" in the template.
inline std::string expandTemplate(std::string tpl, const std::string_view key, const std::string_view value) {
    const std::string needle = "{" + std::string(key) + "}";
    for (size_t pos = tpl.find(needle); pos != std::string::npos; pos = tpl.find(needle, pos + value.size()))
        tpl.replace(pos, needle.size(), value);
    return tpl;
}

}

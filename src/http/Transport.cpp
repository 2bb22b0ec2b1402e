#include "http/Transport.hpp"

#include <algorithm>
#include <cctype>

namespace loft::http {

static bool iequals(const std::string_view a, const std::string_view b) {
    return a.size() == b.size() && std::ranges::equal(a, b, [](const char x, const char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

std::string_view to_string(const Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        case Method::Put: return "PUT";
        case Method::Delete: return "DELETE";
    }
    return "GET";
}

void Request::setHeader(const std::string& name, const std::string& value) {
    std::erase_if(headers, [&](const auto& h) { return iequals(h.first, name); });
    headers.emplace_back(name, value);
}

std::optional<std::string> Request::header(const std::string_view name) const {
    for (const auto& [k, v] : headers)
        if (iequals(k, name)) return v;
    return std::nullopt;
}

const FormPart* Request::field(const std::string_view name) const {
    const auto it = std::ranges::find_if(form, [&](const FormPart& p) { return p.name == name; });
    return it == form.end() ? nullptr : &*it;
}

}

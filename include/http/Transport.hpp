#pragma once

#include "http/CancelToken.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace loft::http {

enum class Method { Get, Post, Put, Delete };

std::string_view to_string(Method method);

struct FormPart {
    std::string name;
    std::string value;
    std::optional<std::string> filename{};
    std::optional<std::string> content_type{};
};

struct Request {
    Method method = Method::Get;
    std::string url{};
    std::vector<std::pair<std::string, std::string>> headers{};
    std::string body{};
    std::vector<FormPart> form{}; // non-empty => multipart/form-data, body is ignored

    /// Replaces any header with the same (case-insensitive) name.
    void setHeader(const std::string& name, const std::string& value);
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    [[nodiscard]] bool isMultipart() const { return !form.empty(); }
    [[nodiscard]] const FormPart* field(std::string_view name) const;
};

struct Response {
    long status = 0;
    std::string body{};

    [[nodiscard]] bool ok() const { return status / 100 == 2; }
};

/// Receives response bytes as they arrive. Returning false aborts the transfer.
using Sink = std::function<bool(const char* data, size_t len)>;

class Transport {
public:
    virtual ~Transport() = default;

    /// Buffers the whole response body.
    virtual Response perform(const Request& req, const CancelToken& cancel) = 0;

    /// Success bodies go to the sink; other statuses are buffered into Response::body.
    virtual Response stream(const Request& req, const Sink& sink, const CancelToken& cancel) = 0;
};

}

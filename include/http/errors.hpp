#pragma once

#include <stdexcept>
#include <string>

namespace loft::http {

/// The request never produced an HTTP status (DNS, TLS, connection reset...).
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& what, const int curlCode)
        : std::runtime_error(what), code_(curlCode) {}

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

/// Aborted through a CancelToken, its deadline, or a consumer that stopped reading.
class Cancelled : public TransportError {
public:
    using TransportError::TransportError;
};

}

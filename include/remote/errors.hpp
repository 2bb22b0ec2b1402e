#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace loft::remote {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NotFound : public Error {
public:
    using Error::Error;
};

class NoFile final : public NotFound {
public:
    explicit NoFile(const std::string& path) : NotFound("no file found: " + path) {}
};

class NoFolder final : public NotFound {
public:
    explicit NoFolder(const std::string& path) : NotFound("no folder found: " + path) {}
};

/// The backend rejected the supplied credentials.
class AuthFailed final : public Error {
public:
    AuthFailed(const std::string& what, const long status) : Error(what), status_(status) {}
    [[nodiscard]] long status() const noexcept { return status_; }

private:
    long status_;
};

class NoToken final : public Error {
public:
    explicit NoToken(const std::string& user) : Error("could not find access token for user '" + user + "'") {}
};

/// Terminal: the refresh token is past its expiry, a new authenticate() is required.
class RefreshExpired final : public Error {
public:
    explicit RefreshExpired(const std::string& user) : Error("refresh token expired for user '" + user + "'") {}
};

class UnexpectedStatus final : public Error {
public:
    UnexpectedStatus(const std::string& what, const long status) : Error(what), status_(status) {}
    [[nodiscard]] long status() const noexcept { return status_; }

private:
    long status_;
};

/// 2xx response whose envelope carried success=false.
class RequestRejected final : public Error {
public:
    RequestRejected(const std::string& what, std::string message) : Error(what), message_(std::move(message)) {}
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    std::string message_;
};

class ProtocolViolation final : public Error {
public:
    using Error::Error;
};

/// The upload source ran dry before the announced size was read.
class ShortSource final : public Error {
public:
    using Error::Error;
};

class EmptyPayload final : public Error {
public:
    using Error::Error;
};

class NotSupported final : public Error {
public:
    using Error::Error;
};

class DecodeError final : public Error {
public:
    using Error::Error;
};

}

#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace HonestMark {

// Base of every failure a Submit() future can carry.
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& message) : std::runtime_error(message) {}
};

// Bad input. Raised before any network call is issued.
class ValidationError : public ClientError {
public:
    explicit ValidationError(const std::string& message) : ClientError(message) {}
};

// Request encoding or response decoding failed.
class EncodingError : public ClientError {
public:
    explicit EncodingError(const std::string& message) : ClientError(message) {}
};

// Connection or I/O failure reported by the transport. Never retried.
class TransportError : public ClientError {
public:
    explicit TransportError(const std::string& message) : ClientError(message) {}
};

// Non-200 status, undecodable 200 body, or an error reported by the service.
class ApiError : public ClientError {
public:
    ApiError(const std::string& message, long status_code, std::string body, std::string error_code = {})
        : ClientError(message), status_code_(status_code), body_(std::move(body)), error_code_(std::move(error_code)) {}

    long status_code() const { return status_code_; }
    const std::string& body() const { return body_; }
    const std::string& error_code() const { return error_code_; }

private:
    long status_code_;
    std::string body_;
    std::string error_code_;
};

class ClientClosedError : public ClientError {
public:
    explicit ClientClosedError(const std::string& message) : ClientError(message) {}
};

class OperationCancelled : public ClientError {
public:
    explicit OperationCancelled(const std::string& message) : ClientError(message) {}
};

}

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace chregistry {

enum class StatusCode {
    ok = 0,
    invalid_argument, // malformed registration or config value
    not_found,
    timeout,          // outbound call exceeded the client timeout
    unavailable,      // outbound call failed or returned a non-2xx status
    cancelled,
    internal_error,   // unexpected failure while mutating registry state
};

inline const char* StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::cancelled: return "cancelled";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

class Status {
public:
    Status() : code_(StatusCode::ok) {}
    Status(StatusCode code, std::string message) : code_(code), message_(std::move(message)) {}

    static Status Ok() { return Status(); }

    bool ok() const { return code_ == StatusCode::ok; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // "<code>: <message>", for logs.
    std::string ToString() const {
        if (message_.empty()) {
            return StatusCodeName(code_);
        }
        return std::string(StatusCodeName(code_)) + ": " + message_;
    }

private:
    StatusCode code_;
    std::string message_;
};

template <class T>
class Result {
public:
    Result(T value) : status_(Status::Ok()), value_(std::move(value)) {}
    Result(Status status) : status_(std::move(status)) {}

    bool ok() const { return status_.ok(); }
    const Status& status() const { return status_; }

    const T& value() const& { return *value_; }
    T& value() & { return *value_; }
    T&& value() && { return std::move(*value_); }

private:
    Status status_;
    std::optional<T> value_;
};

} // namespace chregistry

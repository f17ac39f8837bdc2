#pragma once
#include <optional>
#include <string>
#include <utility>

namespace replywatch {

// Failure categories. Callers branch on the kind instead of catching broadly.
enum class ErrorKind {
    TransientExternal,  // lock contention, network failure, timeout: retry next cycle
    NotFound,           // unknown conversation or profile: skip
    MalformedResponse,  // unparseable structured output: degrade
    FatalPrecondition   // unusable at startup: abort before the loop
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransientExternal: return "transient_external";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::MalformedResponse: return "malformed_response";
        case ErrorKind::FatalPrecondition: return "fatal_precondition";
    }
    return "transient_external";
}

struct Error {
    ErrorKind kind = ErrorKind::TransientExternal;
    std::string message;
};

// Either a value or an Error.
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {} // NOLINT(google-explicit-constructor)
    Result(Error error) : error_(std::move(error)) {} // NOLINT(google-explicit-constructor)

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    template <typename U>
    T value_or(U&& fallback) const {
        return value_ ? *value_ : static_cast<T>(std::forward<U>(fallback));
    }

    const Error& error() const { return *error_; }
    ErrorKind kind() const { return error_->kind; }

private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

} // namespace replywatch

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace concierge {

enum class ErrorKind {
    InvalidInput,         // empty prompt, non-positive top_k
    SessionNotFound,      // chat/reset against a session that was never resolved
    ConfigurationError,   // upstream unreachable while building an agent
    AgentInvocationError, // model or tool failure during a chat turn
    UpstreamError         // embedding provider or vector store failure during search
};

const char* error_kind_name(ErrorKind kind);

// HTTP status the boundary reports for each kind.
int http_status_for(ErrorKind kind);

struct ServiceError {
    ErrorKind kind;
    std::string message;
    std::string cause; // underlying exception text, empty when there is none

    std::string describe() const;
};

inline ServiceError make_error(ErrorKind kind, std::string message, std::string cause = "") {
    return ServiceError{kind, std::move(message), std::move(cause)};
}

template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(ServiceError error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(state_); }
    const T& value() const { return std::get<T>(state_); }

    const ServiceError& error() const { return std::get<ServiceError>(state_); }

private:
    std::variant<T, ServiceError> state_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(ServiceError error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const ServiceError& error() const { return *error_; }

private:
    std::optional<ServiceError> error_;
};

} // namespace concierge

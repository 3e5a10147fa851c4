#include "service_error.hpp"

namespace concierge {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::SessionNotFound: return "SessionNotFound";
        case ErrorKind::ConfigurationError: return "ConfigurationError";
        case ErrorKind::AgentInvocationError: return "AgentInvocationError";
        case ErrorKind::UpstreamError: return "UpstreamError";
    }
    return "Unknown";
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:
        case ErrorKind::SessionNotFound:
            return 400;
        case ErrorKind::UpstreamError:
            return 502;
        case ErrorKind::ConfigurationError:
        case ErrorKind::AgentInvocationError:
            return 500;
    }
    return 500;
}

std::string ServiceError::describe() const {
    std::string out = std::string(error_kind_name(kind)) + ": " + message;
    if (!cause.empty()) out += " (" + cause + ")";
    return out;
}

} // namespace concierge

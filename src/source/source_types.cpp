#include "source_types.hpp"

namespace Shio {

bool Error::is_transient() const {
    if (kind != ErrorKind::Transport) return false;

    switch (transport) {
        case TransportFailure::Timeout:
        case TransportFailure::Connection:
            return true;
        case TransportFailure::BadStatus:
            return http_status >= 500 || http_status == 429;
        default:
            return false;
    }
}

std::string Error::describe() const {
    switch (kind) {
        case ErrorKind::None:
            return "";
        case ErrorKind::Transport:
            if (transport == TransportFailure::Timeout) {
                return "Request timed out: " + message;
            }
            if (transport == TransportFailure::BadStatus) {
                return "Server returned HTTP " + std::to_string(http_status);
            }
            return "Network error: " + message;
        case ErrorKind::Parse:
            return "Source unavailable: " + message;
        case ErrorKind::NotFound:
            return "Not found: " + message;
        case ErrorKind::Launch:
            return "Could not start player: " + message;
    }
    return message;
}

Error Error::transport_error(TransportFailure failure, const std::string& message,
                             unsigned int http_status) {
    Error error;
    error.kind = ErrorKind::Transport;
    error.transport = failure;
    error.http_status = http_status;
    error.message = message;
    return error;
}

Error Error::parse_error(const std::string& message) {
    Error error;
    error.kind = ErrorKind::Parse;
    error.message = message;
    return error;
}

Error Error::not_found(const std::string& message) {
    Error error;
    error.kind = ErrorKind::NotFound;
    error.message = message;
    return error;
}

Error Error::launch_error(const std::string& message) {
    Error error;
    error.kind = ErrorKind::Launch;
    error.message = message;
    return error;
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::Launch: return "launch";
    }
    return "unknown";
}

} // namespace Shio

#pragma once

#include <exception>
#include <string>

namespace objio {

enum class ErrorCode {
    NotFound,        // Object doesn't exist
    AccessDenied,    // Permission/auth failure
    NetworkError,    // Transport-level failure (connection, HTTP status, etc.)
    InvalidURI,      // Malformed URI or object key
    IOError,         // Local filesystem error
    ConfigError,     // YAML config or routing error
    Unsupported,     // Operation mode not implemented (e.g. relative seek)
    InvalidArgument  // Caller passed an out-of-range value
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:        return "NotFound";
        case ErrorCode::AccessDenied:    return "AccessDenied";
        case ErrorCode::NetworkError:    return "NetworkError";
        case ErrorCode::InvalidURI:      return "InvalidURI";
        case ErrorCode::IOError:         return "IOError";
        case ErrorCode::ConfigError:     return "ConfigError";
        case ErrorCode::Unsupported:     return "Unsupported";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        default:                         return "Unknown";
    }
}

// Single exception type for the library.
// context identifies the failing object, URL or path (may be empty).
class ObjError : public std::exception {
public:
    ObjError(ErrorCode code, const std::string& message)
        : code_(code), message_(message), context_() {
        build_what();
    }

    ObjError(ErrorCode code, const std::string& context, const std::string& message)
        : code_(code), message_(message), context_(context) {
        build_what();
    }

    ErrorCode code() const noexcept { return code_; }
    const char* what() const noexcept override { return what_.c_str(); }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }

private:
    void build_what() {
        what_ = std::string("[objio::") + error_code_to_string(code_) + "] " + message_;
        if (!context_.empty()) {
            what_ += " (at: " + context_ + ")";
        }
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string what_;
};

} // namespace objio

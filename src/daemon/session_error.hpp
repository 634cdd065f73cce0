#pragma once

#include <expected>
#include <string>
#include <string_view>

enum class ErrorKind {
    NoCredential,
    CaptureUnavailable,
    EmptyCapture,
    ServiceFailure,
    EmptyClipboard,
};

// A failure that terminates the session and is shown to the user.
struct SessionError {
    ErrorKind kind = ErrorKind::ServiceFailure;
    std::string message;
};

inline std::unexpected<SessionError> make_error(ErrorKind kind, std::string message) {
    return std::unexpected(SessionError{kind, std::move(message)});
}

inline std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoCredential: return "no_credential";
        case ErrorKind::CaptureUnavailable: return "capture_unavailable";
        case ErrorKind::EmptyCapture: return "empty_capture";
        case ErrorKind::ServiceFailure: return "service_failure";
        case ErrorKind::EmptyClipboard: return "empty_clipboard";
    }
    return "unknown";
}

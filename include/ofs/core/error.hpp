#pragma once

#include <ostream>
#include <string>

namespace ofs {

/**
 * @brief Failure taxonomy shared by the cache, operation log, sync and upload paths
 *
 * Network and Timeout are transient. Conflict is routed through the conflict
 * policy. Validation is fatal and never retried. Quota triggers eviction and
 * one retry. NotFound means the remote entity is gone.
 */
enum class ErrorKind {
    Network,
    Timeout,
    Conflict,
    Validation,
    Quota,
    NotFound,
    Storage,
    InvalidState,
    Cancelled,
    Offline,
    Unknown
};

struct Error {
    ErrorKind kind = ErrorKind::Unknown;
    std::string message;
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

inline bool is_retryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::Network || kind == ErrorKind::Timeout;
}

inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Network: return "network";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Quota: return "quota";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::InvalidState: return "invalid_state";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Offline: return "offline";
        default: return "unknown";
    }
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

inline std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << describe(error);
}

} // namespace ofs

#pragma once

#include <stdexcept>
#include <string>

namespace deltastore {

// Failure categories shared by thrown construction errors and per-operation results
enum class ErrorKind {
    None,
    InvalidLocation,   // unknown scheme, malformed URL, unmappable path
    NotRegistered,     // ObjectStoreRegistry miss
    OptionParse,       // malformed numeric/duration option
    JoinError,         // unit of work dropped before it completed on an IO runtime
    NotFound,
    AlreadyExists,
    Precondition,
    NotModified,
    InvalidPath,
    InvalidRange,
    NotSupported,
    Generic
};

constexpr const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::InvalidLocation: return "invalid table location";
        case ErrorKind::NotRegistered: return "not registered";
        case ErrorKind::OptionParse: return "option parse error";
        case ErrorKind::JoinError: return "join error";
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::AlreadyExists: return "already exists";
        case ErrorKind::Precondition: return "precondition failed";
        case ErrorKind::NotModified: return "not modified";
        case ErrorKind::InvalidPath: return "invalid path";
        case ErrorKind::InvalidRange: return "invalid range";
        case ErrorKind::NotSupported: return "not supported";
        case ErrorKind::Generic: return "generic error";
    }
    return "unknown";
}

// Thrown by construction paths: URL parsing, factory resolution, option parsing,
// registry lookup. Never thrown by ObjectStore operations for environmental errors.
class StorageError : public std::runtime_error {
public:
    StorageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace deltastore

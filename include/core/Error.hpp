#pragma once

#include <stdexcept>
#include <string>

namespace chunkwire {

/**
 * Classification used by the sender to decide whether a failed chunk may be retried.
 */
enum class ErrorKind {
    None,
    Transient,          // timeout, connection failure, 5xx: retry within budget
    Permanent,          // malformed request and other 4xx: abort without retry
    OrderingViolation,  // server expected another chunk index
    LocalIO,            // source file missing or unreadable
    Cancelled,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Permanent: return "permanent";
        case ErrorKind::OrderingViolation: return "ordering_violation";
        case ErrorKind::LocalIO: return "local_io";
        case ErrorKind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// File not found, not a regular file, or read failure
class LocalIOError : public Error {
public:
    explicit LocalIOError(const std::string& what) : Error(what) {}
};

// Bad wire data: missing fields, bad integers, bad base64 or percent escapes
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& what) : Error(what) {}
};

class StorageError : public Error {
public:
    explicit StorageError(const std::string& what) : Error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace chunkwire

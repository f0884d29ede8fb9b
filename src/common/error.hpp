#pragma once

#include <string>
#include <stdexcept>

namespace cattlediag {
namespace common {

// Error codes
enum class ErrorCode {
    SUCCESS = 0,

    // System errors
    SYSTEM_ERROR = 1000,
    IO_ERROR = 1001,

    // Argument errors
    INVALID_ARGUMENT = 2000,
    INVALID_CONFIG = 2001,
    INVALID_STATE = 2002,

    // Runtime errors
    RUNTIME_ERROR = 3000,
    RUNTIME_UNAVAILABLE = 3001,

    // Request errors
    BAD_REQUEST = 4000,
    UNAUTHORIZED = 4001,
    PAYLOAD_TOO_LARGE = 4002,
    UNSUPPORTED_MEDIA = 4003,
    IMAGE_DECODE_ERROR = 4004,

    // Model errors
    MODEL_LOAD_ERROR = 5000,
    CHECKPOINT_ERROR = 5001,
    BINDING_ERROR = 5002,

    // Artifact errors
    ARTIFACT_NOT_FOUND = 6000,

    // Other errors
    UNKNOWN_ERROR = 9999
};

// Base exception class
class Exception : public std::runtime_error {
public:
    Exception(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// System exception
class SystemException : public Exception {
public:
    SystemException(const std::string& message)
        : Exception(ErrorCode::SYSTEM_ERROR, message) {}
};

// I/O exception
class IOException : public Exception {
public:
    IOException(const std::string& message)
        : Exception(ErrorCode::IO_ERROR, message) {}
};

// Argument exception
class ArgumentException : public Exception {
public:
    ArgumentException(const std::string& message)
        : Exception(ErrorCode::INVALID_ARGUMENT, message) {}
};

// Configuration exception
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message)
        : Exception(ErrorCode::INVALID_CONFIG, message) {}
};

// Runtime exception
class RuntimeException : public Exception {
public:
    RuntimeException(const std::string& message)
        : Exception(ErrorCode::RUNTIME_ERROR, message) {}
};

// Client-side request error, carries the HTTP status to answer with
class RequestException : public Exception {
public:
    RequestException(int http_status, ErrorCode code, const std::string& message)
        : Exception(code, message)
        , http_status_(http_status) {}

    RequestException(const std::string& message)
        : RequestException(400, ErrorCode::BAD_REQUEST, message) {}

    int http_status() const { return http_status_; }

private:
    int http_status_;
};

// Authorization failure
class UnauthorizedException : public RequestException {
public:
    UnauthorizedException(const std::string& message)
        : RequestException(401, ErrorCode::UNAUTHORIZED, message) {}
};

// Model load exception
class ModelLoadException : public Exception {
public:
    ModelLoadException(const std::string& message)
        : Exception(ErrorCode::MODEL_LOAD_ERROR, message) {}
};

// Checkpoint deserialization exception
class CheckpointException : public Exception {
public:
    CheckpointException(const std::string& message)
        : Exception(ErrorCode::CHECKPOINT_ERROR, message) {}
};

// Error handling macros
#define CHECK_ARG(condition, message) { \
    if (!(condition)) { \
        throw cattlediag::common::ArgumentException(message); \
    } \
}

#define CHECK_STATE(condition, message) { \
    if (!(condition)) { \
        throw cattlediag::common::RuntimeException(message); \
    } \
}

} // namespace common
} // namespace cattlediag

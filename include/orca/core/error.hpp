#pragma once

/**
 * @file error.hpp
 * @brief Typed error values carried by orca::Result
 *
 * Configuration errors are raised while an automation is authored.
 * Query errors come back from the event store and are mapped to HTTP
 * status codes by the API layer (InvalidToken -> 403,
 * InvalidParameters -> 422, NotFound -> 404).
 */

#include <string>
#include <utility>

namespace orca {

enum class ErrorCode {
    InvalidArgument,
    InvalidToken,
    InvalidParameters,
    NotFound,
    AlreadyExists,
    Configuration,
    ParseError,
    Internal
};

struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static Error invalid_argument(std::string msg) { return {ErrorCode::InvalidArgument, std::move(msg)}; }
    static Error invalid_token(std::string msg) { return {ErrorCode::InvalidToken, std::move(msg)}; }
    static Error invalid_parameters(std::string msg) { return {ErrorCode::InvalidParameters, std::move(msg)}; }
    static Error not_found(std::string msg) { return {ErrorCode::NotFound, std::move(msg)}; }
    static Error already_exists(std::string msg) { return {ErrorCode::AlreadyExists, std::move(msg)}; }
    static Error configuration(std::string msg) { return {ErrorCode::Configuration, std::move(msg)}; }
    static Error parse_error(std::string msg) { return {ErrorCode::ParseError, std::move(msg)}; }
    static Error internal(std::string msg) { return {ErrorCode::Internal, std::move(msg)}; }
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::InvalidToken: return "invalid_token";
        case ErrorCode::InvalidParameters: return "invalid_parameters";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::AlreadyExists: return "already_exists";
        case ErrorCode::Configuration: return "configuration";
        case ErrorCode::ParseError: return "parse_error";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

} // namespace orca

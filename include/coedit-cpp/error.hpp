/// @file error.hpp
/// @brief Error types for the coedit-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace coedit_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_value,      ///< An identity value or query text is empty or malformed.
    invalid_session,    ///< A session id is empty.
    invalid_document,   ///< A document id is empty or a restored document breaks its invariants.
    invalid_operation,  ///< An operation is invalid in the current state.
    session_not_found,  ///< No open session has the requested id.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_value:     return "invalid_value";
        case ErrorKind::invalid_session:   return "invalid_session";
        case ErrorKind::invalid_document:  return "invalid_document";
        case ErrorKind::invalid_operation: return "invalid_operation";
        case ErrorKind::session_not_found: return "session_not_found";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Base exception carrying a structured Error.
///
/// Construction-time validation failures propagate to the caller as
/// one of the subclasses below; the caller translates them into a
/// rejection of the originating request.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// Empty or malformed identity value.
class InvalidValueError : public Exception {
public:
    explicit InvalidValueError(std::string msg)
        : Exception{Error{ErrorKind::invalid_value, std::move(msg)}} {}
};

/// Empty session id.
class InvalidSessionError : public Exception {
public:
    explicit InvalidSessionError(std::string msg)
        : Exception{Error{ErrorKind::invalid_session, std::move(msg)}} {}
};

/// Empty document id, or a restored document whose history is inconsistent.
class InvalidDocumentError : public Exception {
public:
    explicit InvalidDocumentError(std::string msg)
        : Exception{Error{ErrorKind::invalid_document, std::move(msg)}} {}
};

/// A state transition that is not allowed from the current state.
class InvalidOperationError : public Exception {
public:
    explicit InvalidOperationError(std::string msg)
        : Exception{Error{ErrorKind::invalid_operation, std::move(msg)}} {}
};

/// Lookup of a session id that is not open.
class SessionNotFoundError : public Exception {
public:
    explicit SessionNotFoundError(std::string msg)
        : Exception{Error{ErrorKind::session_not_found, std::move(msg)}} {}
};

}  // namespace coedit_cpp

/// @file error.hpp
/// @brief Error types for the docstore-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace docstore_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    not_found,    ///< No record matched and the caller asked for one.
    conflict,     ///< Several records matched, a duplicate id, or conflicting edits.
    bad_request,  ///< Malformed filter, patch or record supplied by the caller.
    internal,     ///< An unexpected fault inside an operation.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::not_found:   return "not_found";
        case ErrorKind::conflict:    return "conflict";
        case ErrorKind::bad_request: return "bad_request";
        case ErrorKind::internal:    return "internal";
    }
    return "unknown";
}

/// The HTTP status code a service layer reports for an ErrorKind.
constexpr auto http_status(ErrorKind kind) noexcept -> int {
    switch (kind) {
        case ErrorKind::not_found:   return 404;
        case ErrorKind::conflict:    return 409;
        case ErrorKind::bad_request: return 400;
        case ErrorKind::internal:    return 500;
    }
    return 500;
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

/// The single exception type raised by the store and its engines.
///
/// `what()` reads "database exception <message>"; the structured Error
/// stays available through error().
class DbError : public std::runtime_error {
public:
    DbError(ErrorKind kind, std::string message)
        : std::runtime_error{"database exception " + message},
          error_{kind, std::move(message)} {}

    explicit DbError(Error error)
        : std::runtime_error{"database exception " + error.message},
          error_{std::move(error)} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto message() const noexcept -> const std::string& { return error_.message; }
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

/// Raised by the patch engine on a malformed or conflicting patch.
class PatchError : public DbError {
public:
    explicit PatchError(std::string message,
                        ErrorKind kind = ErrorKind::bad_request)
        : DbError{kind, std::move(message)} {}
};

/// Raised by the filter compiler on an unusable filter.
class QueryError : public DbError {
public:
    explicit QueryError(std::string message)
        : DbError{ErrorKind::bad_request, std::move(message)} {}
};

}  // namespace docstore_cpp

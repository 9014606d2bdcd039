/// @file error.hpp
/// @brief Error types for the litdocx library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace litdocx {

/// Categories of errors that can occur while rendering a document.
enum class ErrorKind : std::uint8_t {
    structural_error,  ///< The markup tree contains an unknown or misplaced tag.
    markup_error,      ///< The markdown source cannot be represented as a tree.
    catalog_error,     ///< The numbering catalog is missing or malformed.
    archive_error,     ///< The template archive is unreadable or incomplete.
    config_error,      ///< The options file is invalid.
    io_error,          ///< A file could not be read or written.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::structural_error: return "structural_error";
        case ErrorKind::markup_error:     return "markup_error";
        case ErrorKind::catalog_error:    return "catalog_error";
        case ErrorKind::archive_error:    return "archive_error";
        case ErrorKind::config_error:     return "config_error";
        case ErrorKind::io_error:         return "io_error";
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

/// Exception thrown by every fallible litdocx operation.
///
/// Conversion never produces partial output: the first error aborts the
/// whole call and surfaces here.
class ConversionError : public std::runtime_error {
public:
    explicit ConversionError(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    ConversionError(ErrorKind kind, std::string message)
        : ConversionError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace litdocx

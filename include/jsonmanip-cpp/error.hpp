/// @file error.hpp
/// @brief Error types for the jsonmanip-cpp library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace jsonmanip_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    syntax_error,     ///< A query or literal is malformed.
    type_error,       ///< A container, key or value has the wrong kind.
    value_error,      ///< Well-formed input that is semantically invalid.
    index_error,      ///< A sequence index is out of range.
    key_error,        ///< A mapping key or patch field does not exist.
    assertion_error,  ///< An `assert` patch operation failed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::syntax_error:    return "syntax_error";
        case ErrorKind::type_error:      return "type_error";
        case ErrorKind::value_error:     return "value_error";
        case ErrorKind::index_error:     return "index_error";
        case ErrorKind::key_error:       return "key_error";
        case ErrorKind::assertion_error: return "assertion_error";
    }
    return "unknown";
}

/// An exception with a category and a human-readable message.
///
/// Every error raised by the library is an Error (or a SyntaxError, which
/// additionally carries a source position).
class Error : public std::runtime_error {
public:
    /// Construct an Error with the given kind and message.
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    /// The category of this error.
    auto kind() const noexcept -> ErrorKind { return kind_; }

private:
    ErrorKind kind_;
};

/// A malformed query, filter or query value.
///
/// Positions are byte offsets into `doc()`. Line and column numbers are
/// 1-based and derived once at construction. `\n`, `\r` and `\r\n` each
/// count as one line break.
class SyntaxError : public Error {
public:
    /// @param msg The bare message (e.g. "Expecting value").
    /// @param filename A label for the source (e.g. "<query>").
    /// @param doc The full text that was being scanned.
    /// @param start Offset of the first offending byte.
    /// @param end Offset one past the last offending byte, or, when zero or
    ///   negative, the number of bytes after `start` to select (clamped to
    ///   the end of the line).
    SyntaxError(std::string msg, std::string filename, std::string doc,
                std::size_t start, std::ptrdiff_t end = 0);

    auto what() const noexcept -> const char* override { return what_.c_str(); }

    auto msg() const noexcept -> const std::string& { return msg_; }
    auto filename() const noexcept -> const std::string& { return filename_; }
    auto doc() const noexcept -> const std::string& { return doc_; }
    auto start() const noexcept -> std::size_t { return start_; }
    auto end() const noexcept -> std::size_t { return end_; }
    auto lineno() const noexcept -> std::size_t { return lineno_; }
    auto colno() const noexcept -> std::size_t { return colno_; }
    auto end_lineno() const noexcept -> std::size_t { return end_lineno_; }
    auto end_colno() const noexcept -> std::size_t { return end_colno_; }

private:
    std::string msg_;
    std::string filename_;
    std::string doc_;
    std::size_t start_;
    std::size_t end_;
    std::size_t lineno_{1};
    std::size_t colno_{1};
    std::size_t end_lineno_{1};
    std::size_t end_colno_{1};
    std::string what_;
};

/// Render a syntax error as a short report, one string per line, each
/// ending in a newline:
///
/// @code
///   File "<query>", line 1, column 4
///     $[0
///        ^
/// jsonmanip_cpp::SyntaxError: Expecting a closing bracket
/// @endcode
auto format_syntax_error(const SyntaxError& exc) -> std::vector<std::string>;

}  // namespace jsonmanip_cpp

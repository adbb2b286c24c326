/// @file error.hpp
/// @brief Error types for the jsondb-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsondb_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    not_found,             ///< A read found no data and the store throws on missing data.
    invalid_key,           ///< A dictionary key is not a simple key.
    missing_key,           ///< A dictionary write requires a key and none was given.
    missing_index,         ///< An array merge requires an index and none was given.
    merge_target_missing,  ///< A merge was attempted where no data exists yet.
    index_out_of_range,    ///< An array index is not a valid insertion point.
    io_failure,            ///< The backing file could not be read or written.
    invalid_path,          ///< A path or separator could not be parsed.
    type_mismatch,         ///< A node on the path has the wrong JSON type.
    not_loaded,            ///< A save was requested before the document was loaded.
    parse_error,           ///< The backing file does not contain valid JSON.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::not_found:            return "not_found";
        case ErrorKind::invalid_key:          return "invalid_key";
        case ErrorKind::missing_key:          return "missing_key";
        case ErrorKind::missing_index:        return "missing_index";
        case ErrorKind::merge_target_missing: return "merge_target_missing";
        case ErrorKind::index_out_of_range:   return "index_out_of_range";
        case ErrorKind::io_failure:           return "io_failure";
        case ErrorKind::invalid_path:         return "invalid_path";
        case ErrorKind::type_mismatch:        return "type_mismatch";
        case ErrorKind::not_loaded:           return "not_loaded";
        case ErrorKind::parse_error:          return "parse_error";
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

/// The exception thrown by every failing store operation.
///
/// what() yields "<kind>: <message>".
class Exception : public std::runtime_error {
public:
    explicit Exception(Error err)
        : std::runtime_error{std::string{to_string_view(err.kind)} + ": " + err.message},
          error_{std::move(err)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace jsondb_cpp

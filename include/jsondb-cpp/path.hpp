/// @file path.hpp
/// @brief Path resolution: (base path, shape, locator) -> canonical path.
///
/// A canonical path is a separator-delimited string whose segments are
/// object keys optionally followed by bracket suffixes:
///
///   "/restaurants[2]"     third element of the "restaurants" array
///   "/restaurants[-1]"    last element
///   "/restaurants[]"      append position (writes only)
///   "/teams/alice"        key "alice" of the "teams" object
///
/// resolve_path() builds such strings from a declared shape and a locator;
/// parse_path() splits them into steps for the tree navigator.

#pragma once

#include <jsondb-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsondb_cpp {

/// The default path segment delimiter.
inline constexpr std::string_view default_separator = "/";

/// Marks "insert at the end of this array" in a write path.
struct AppendMarker {
    auto operator==(const AppendMarker&) const -> bool = default;
};

/// One step of a parsed path: object key, array index, or append marker.
using PathStep = std::variant<std::string, std::int64_t, AppendMarker>;

/// Whether a path is resolved for reading or for writing.
///
/// An Array operation without a locator reads the last element but
/// writes to the append position.
enum class Access : std::uint8_t {
    read,
    write,
};

/// Check that a dictionary key is simple: non-empty, free of '[' and of
/// the separator. One trailing separator is tolerated.
auto is_simple_key(std::string_view key,
                   std::string_view separator = default_separator) -> bool;

/// Build the canonical path for an operation.
///
/// - single: the base path; the locator is ignored.
/// - array: base + "[i]"; without a locator, base + "[-1]" on read and
///   base + "[]" on write.
/// - dictionary: base + separator + key; without a locator, the base path.
///
/// @throws Exception invalid_key if a dictionary key is not simple or an
///   array is given a string locator.
auto resolve_path(std::string_view base, Shape shape,
                  const std::optional<Locator>& locator, Access access,
                  std::string_view separator = default_separator) -> std::string;

/// Spell a path the way schema lookups expect it: one leading separator,
/// no empty segments. "restaurants", "/restaurants" and "//restaurants/"
/// all become "/restaurants"; the root becomes the separator alone.
auto normalize_path(std::string_view path,
                    std::string_view separator = default_separator) -> std::string;

/// Split a canonical path into steps.
///
/// Empty segments are skipped, so "", "/" and "//" all address the root.
/// @throws Exception invalid_path on an unbalanced bracket or a bracket
///   suffix that is neither empty nor an integer.
auto parse_path(std::string_view path,
                std::string_view separator = default_separator) -> std::vector<PathStep>;

}  // namespace jsondb_cpp

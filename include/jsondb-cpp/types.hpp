/// @file types.hpp
/// @brief Entry shapes, schemas and locators.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsondb_cpp {

/// The declared category of a top-level path.
///
/// The shape is fixed when the store is constructed. It decides how a
/// locator is turned into a path; the stored JSON content is never
/// inspected to infer it.
enum class Shape : std::uint8_t {
    single,      ///< One value, addressed without a locator.
    array,       ///< An ordered list, addressed by integer index.
    dictionary,  ///< A string-keyed map, addressed by simple key.
};

/// Convert a Shape to its string representation.
constexpr auto to_string_view(Shape shape) noexcept -> std::string_view {
    switch (shape) {
        case Shape::single:     return "single";
        case Shape::array:      return "array";
        case Shape::dictionary: return "dictionary";
    }
    return "unknown";
}

/// Parse a shape name ("single", "array", "dictionary").
constexpr auto parse_shape(std::string_view name) noexcept -> std::optional<Shape> {
    if (name == "single") return Shape::single;
    if (name == "array") return Shape::array;
    if (name == "dictionary") return Shape::dictionary;
    return std::nullopt;
}

/// Entry descriptors: top-level path -> declared shape.
using Schema = std::map<std::string, Shape, std::less<>>;

/// Qualifies an operation on an array (index) or dictionary (key) entry.
///
/// Negative indices count from the end; -1 is the last element at the
/// time of the call.
using Locator = std::variant<std::int64_t, std::string>;

/// Index of the last element of an array.
inline constexpr std::int64_t last_index = -1;

/// Create an index Locator.
inline auto at_index(std::int64_t index) -> Locator { return Locator{index}; }

/// Create a key Locator.
inline auto at_key(std::string key) -> Locator { return Locator{std::move(key)}; }

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& key) { ... },
///     [](std::int64_t index) { ... },
/// }, locator);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsondb_cpp

#include <jsondb-cpp/path.hpp>
#include <jsondb-cpp/error.hpp>

#include <charconv>
#include <string>
#include <system_error>

namespace jsondb_cpp {

namespace {

auto ends_with_separator(std::string_view key, std::string_view separator) -> bool {
    return key.size() > separator.size() && key.ends_with(separator);
}

auto strip_trailing_separator(std::string_view key, std::string_view separator)
    -> std::string_view {
    if (ends_with_separator(key, separator)) {
        key.remove_suffix(separator.size());
    }
    return key;
}

/// Parse the contents of a bracket suffix ("" = append, otherwise a
/// possibly negative decimal integer).
auto parse_bracket(std::string_view content, std::string_view path) -> PathStep {
    if (content.empty()) return AppendMarker{};
    auto index = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(content.data(), content.data() + content.size(), index);
    if (ec != std::errc{} || ptr != content.data() + content.size()) {
        throw Exception{ErrorKind::invalid_path,
                        "invalid array index '" + std::string{content} +
                        "' in path '" + std::string{path} + "'"};
    }
    return index;
}

/// Parse one separator-delimited segment: "key", "key[0]", "[1][-1]", "key[]".
void parse_segment(std::string_view segment, std::string_view path,
                   std::vector<PathStep>& steps) {
    auto open = segment.find('[');
    auto key = segment.substr(0, open);
    if (!key.empty()) steps.emplace_back(std::string{key});
    while (open != std::string_view::npos) {
        auto close = segment.find(']', open + 1);
        if (close == std::string_view::npos) {
            throw Exception{ErrorKind::invalid_path,
                            "unbalanced '[' in path '" + std::string{path} + "'"};
        }
        steps.push_back(parse_bracket(segment.substr(open + 1, close - open - 1), path));
        auto next = close + 1;
        if (next == segment.size()) break;
        if (segment[next] != '[') {
            throw Exception{ErrorKind::invalid_path,
                            "unexpected text after ']' in path '" + std::string{path} + "'"};
        }
        open = next;
    }
}

}  // anonymous namespace

auto is_simple_key(std::string_view key, std::string_view separator) -> bool {
    key = strip_trailing_separator(key, separator);
    if (key.empty()) return false;
    if (key.find('[') != std::string_view::npos) return false;
    return separator.empty() || key.find(separator) == std::string_view::npos;
}

auto resolve_path(std::string_view base, Shape shape,
                  const std::optional<Locator>& locator, Access access,
                  std::string_view separator) -> std::string {
    auto path = std::string{base};
    switch (shape) {
        case Shape::single:
            return path;

        case Shape::array:
            if (!locator) {
                return path + (access == Access::write ? "[]" : "[-1]");
            }
            if (const auto* index = std::get_if<std::int64_t>(&*locator)) {
                return path + "[" + std::to_string(*index) + "]";
            }
            throw Exception{ErrorKind::invalid_key,
                            "array entry '" + path + "' must be addressed by index"};

        case Shape::dictionary: {
            if (!locator) return path;
            auto key = std::visit(overload{
                [](const std::string& k) { return k; },
                [](std::int64_t i) { return std::to_string(i); },
            }, *locator);
            if (!is_simple_key(key, separator)) {
                throw Exception{ErrorKind::invalid_key,
                                "'" + key + "' is not a simple key for dictionary '" + path + "'"};
            }
            return path + std::string{separator} +
                   std::string{strip_trailing_separator(key, separator)};
        }
    }
    return path;
}

auto normalize_path(std::string_view path, std::string_view separator) -> std::string {
    if (separator.empty()) {
        throw Exception{ErrorKind::invalid_path, "path separator must not be empty"};
    }
    auto result = std::string{};
    auto pos = std::size_t{0};
    while (pos <= path.size()) {
        auto next = path.find(separator, pos);
        auto segment = path.substr(pos, next == std::string_view::npos ? next : next - pos);
        if (!segment.empty()) {
            result += separator;
            result += segment;
        }
        if (next == std::string_view::npos) break;
        pos = next + separator.size();
    }
    return result.empty() ? std::string{separator} : result;
}

auto parse_path(std::string_view path, std::string_view separator) -> std::vector<PathStep> {
    if (separator.empty()) {
        throw Exception{ErrorKind::invalid_path, "path separator must not be empty"};
    }
    auto steps = std::vector<PathStep>{};
    auto pos = std::size_t{0};
    while (pos <= path.size()) {
        auto next = path.find(separator, pos);
        auto segment = path.substr(pos, next == std::string_view::npos ? next : next - pos);
        if (!segment.empty()) parse_segment(segment, path, steps);
        if (next == std::string_view::npos) break;
        pos = next + separator.size();
    }
    return steps;
}

}  // namespace jsondb_cpp

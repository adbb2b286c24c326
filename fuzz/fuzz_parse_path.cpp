// Fuzz target for parse_path() and resolve_path().
// Every successfully parsed path is also walked against a small document.

#include <jsondb-cpp/error.hpp>
#include <jsondb-cpp/path.hpp>

#include "src/tree.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};

    static const auto doc = nlohmann::json::parse(R"({"a": {"b": [1, {"c": null}]}, "list": []})");

    try {
        const auto steps = jsondb_cpp::parse_path(input);
        (void)jsondb_cpp::detail::find_node(doc, steps);

        auto copy = doc;
        (void)jsondb_cpp::detail::erase_node(copy, steps);
    } catch (const jsondb_cpp::Exception&) {
        // Malformed paths are expected.
    }

    try {
        (void)jsondb_cpp::resolve_path("/teams", jsondb_cpp::Shape::dictionary,
                                       jsondb_cpp::at_key(std::string{input}),
                                       jsondb_cpp::Access::write);
    } catch (const jsondb_cpp::Exception&) {
        // Non-simple keys are expected.
    }
    return 0;
}

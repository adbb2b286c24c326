#include <jsondb-cpp/json.hpp>
#include <jsondb-cpp/log.hpp>

#include <fstream>
#include <string>

namespace jsondb_cpp {

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, Shape shape) {
    j = std::string{to_string_view(shape)};
}

void from_json(const nlohmann::json& j, Shape& shape) {
    if (!j.is_string()) {
        throw Exception{ErrorKind::parse_error, "shape must be a string, got " + j.dump()};
    }
    auto parsed = parse_shape(j.get_ref<const std::string&>());
    if (!parsed) {
        throw Exception{ErrorKind::parse_error, "unknown shape " + j.dump()};
    }
    shape = *parsed;
}

void to_json(nlohmann::json& j, const StoreOptions& options) {
    j = nlohmann::json{
        {"filename", options.filename},
        {"saveOnPush", options.save_on_push},
        {"humanReadable", options.human_readable},
        {"separator", options.separator},
        {"throwOnMissing", options.throw_on_missing},
    };
}

void from_json(const nlohmann::json& j, StoreOptions& options) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::parse_error, "store options must be a JSON object"};
    }
    auto read = [&j](const char* key, auto& field) {
        if (auto it = j.find(key); it != j.end()) {
            it->get_to(field);
        }
    };
    try {
        read("filename", options.filename);
        read("saveOnPush", options.save_on_push);
        read("humanReadable", options.human_readable);
        read("separator", options.separator);
        read("throwOnMissing", options.throw_on_missing);
    } catch (const nlohmann::json::type_error& e) {
        throw Exception{ErrorKind::parse_error, std::string{"invalid store option: "} + e.what()};
    }
}

void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{
        {"kind", std::string{to_string_view(error.kind)}},
        {"message", error.message},
    };
}

// =============================================================================
// Configuration loading
// =============================================================================

auto load_options(const std::filesystem::path& file) -> StoreOptions {
    auto in = std::ifstream{file};
    if (!in) {
        throw Exception{ErrorKind::io_failure, "cannot open options file " + file.string()};
    }
    auto j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        throw Exception{ErrorKind::parse_error, "options file " + file.string() + " is not valid JSON"};
    }
    auto options = j.get<StoreOptions>();
    JSONDB_LOG_DEBUG("loaded store options from {}", file.string());
    return options;
}

auto schema_from_json(const nlohmann::json& j) -> Schema {
    if (!j.is_object()) {
        throw Exception{ErrorKind::parse_error, "schema must be a JSON object"};
    }
    auto schema = Schema{};
    for (auto it = j.begin(); it != j.end(); ++it) {
        schema.emplace(it.key(), it.value().get<Shape>());
    }
    return schema;
}

}  // namespace jsondb_cpp

/// @file json.hpp
/// @brief nlohmann/json interoperability for jsondb-cpp.
///
/// Provides ADL serialization (to_json/from_json) for shapes, store options
/// and errors, and helpers that read configuration and schemas from JSON.

#pragma once

#include <jsondb-cpp/error.hpp>
#include <jsondb-cpp/options.hpp>
#include <jsondb-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace jsondb_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Shape shape);
void from_json(const nlohmann::json& j, Shape& shape);

/// Options use the camelCase keys of the configuration file:
/// filename, saveOnPush, humanReadable, separator, throwOnMissing.
/// Keys absent from the JSON keep their defaults.
void to_json(nlohmann::json& j, const StoreOptions& options);
void from_json(const nlohmann::json& j, StoreOptions& options);

void to_json(nlohmann::json& j, const Error& error);

// =============================================================================
// Configuration loading
// =============================================================================

/// Read StoreOptions from a JSON configuration file.
/// @throws Exception io_failure if the file cannot be read, parse_error if
///   it is not valid JSON or has fields of the wrong type.
auto load_options(const std::filesystem::path& file) -> StoreOptions;

/// Build a schema from a JSON object mapping paths to shape names.
/// @code
/// auto schema = schema_from_json({{"/login", "single"}, {"/teams", "dictionary"}});
/// @endcode
/// @throws Exception parse_error if the value is not an object of shape names.
auto schema_from_json(const nlohmann::json& j) -> Schema;

}  // namespace jsondb_cpp

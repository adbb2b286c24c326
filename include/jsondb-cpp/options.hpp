/// @file options.hpp
/// @brief Construction parameters of a Store.

#pragma once

#include <filesystem>
#include <string>

namespace jsondb_cpp {

/// Configuration of a Store, fixed for the lifetime of the instance.
///
/// @code
/// auto opts = StoreOptions{.filename = "config", .human_readable = true};
/// @endcode
struct StoreOptions {
    std::string filename;           ///< Backing file (".json" is appended if missing).
    bool save_on_push = true;       ///< Save after every mutating operation.
    bool human_readable = false;    ///< Pretty-print the file on save.
    std::string separator = "/";    ///< Path segment delimiter.
    bool throw_on_missing = false;  ///< Reads of missing data throw instead of returning null.

    auto operator==(const StoreOptions&) const -> bool = default;
};

/// Check that options are usable.
/// @throws Exception invalid_path if the separator is empty or contains a
///   bracket, io_failure if the filename is empty.
void validate_options(const StoreOptions& options);

/// The file a store with these options reads and writes.
auto backing_file(const StoreOptions& options) -> std::filesystem::path;

}  // namespace jsondb_cpp

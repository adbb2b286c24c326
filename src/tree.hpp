#pragma once

// Internal header — not installed. Tree navigation over the in-memory document.

#include <jsondb-cpp/path.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace jsondb_cpp::detail {

// Resolve a (possibly negative) index against an array of the given size.
// nullopt when the index does not name an existing element.
auto element_index(std::int64_t index, std::size_t size) -> std::optional<std::size_t>;

// Resolve an index for a write: an existing element, or size itself to
// append. Throws index_out_of_range otherwise.
auto insertion_index(std::int64_t index, std::size_t size) -> std::size_t;

// Find the node at a path. nullptr if any step is absent or addresses a
// node of the wrong type. Throws invalid_path on an append marker.
auto find_node(const nlohmann::json& doc, const std::vector<PathStep>& steps)
    -> const nlohmann::json*;
auto find_node(nlohmann::json& doc, const std::vector<PathStep>& steps) -> nlohmann::json*;

// Replace the node at a path, creating intermediate objects (key steps)
// and arrays (index steps). The tree is left untouched when the write
// fails (type_mismatch, index_out_of_range).
void put_node(nlohmann::json& doc, const std::vector<PathStep>& steps, nlohmann::json value);

// Shallow-merge a value into the existing node at a path.
//   object into object: key-by-key overwrite
//   array into array:   elements appended
//   array into non-array, object into array: type_mismatch
//   anything else:      the node is replaced
// Throws merge_target_missing if nothing is stored at the path.
void merge_node(nlohmann::json& doc, const std::vector<PathStep>& steps, nlohmann::json value);

// Remove the node at a path. Returns false (and changes nothing) when the
// path does not exist. Erasing the root resets the document to {}.
auto erase_node(nlohmann::json& doc, const std::vector<PathStep>& steps) -> bool;

}  // namespace jsondb_cpp::detail

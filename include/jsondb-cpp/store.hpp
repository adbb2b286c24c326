/// @file store.hpp
/// @brief The Store class -- the primary API for jsondb-cpp.

#pragma once

#include <jsondb-cpp/error.hpp>
#include <jsondb-cpp/options.hpp>
#include <jsondb-cpp/path.hpp>
#include <jsondb-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsondb_cpp {

namespace detail {
class DocumentFile;
}  // namespace detail

/// Predicate for filter() and find(): receives a child value and its key
/// (array children receive their index as a decimal string).
using Predicate = std::function<bool(const nlohmann::json& value, const std::string& key)>;

/// An embedded JSON document store backed by a single file.
///
/// Every top-level path is declared with a Shape in the Schema passed at
/// construction. Operations take the path plus an optional Locator (index
/// for arrays, simple key for dictionaries); the store resolves them to a
/// canonical path and applies the operation to the in-memory document.
/// Paths missing from the schema are treated as single entries. Schema
/// paths and operation paths are compared after normalize_path(), so
/// "teams", "/teams" and "/teams/" name the same entry.
///
/// The document is loaded lazily on first access. With
/// StoreOptions::save_on_push every mutation is written to disk at once;
/// otherwise call save().
///
/// A Store is not thread-safe and must own its file exclusively: callers
/// serialize access, and no two stores should share a file.
///
/// @code
/// auto db = Store{StoreOptions{.filename = "app"},
///                 Schema{{"/login", Shape::single},
///                        {"/restaurants", Shape::array},
///                        {"/teams", Shape::dictionary}}};
/// db.set("/login", {{"username", "a"}, {"password", "b"}});
/// db.merge("/login", {{"username", "c"}});
/// db.push("/restaurants", {{"name", "Chez Nous"}});
/// db.push("/teams", "v1", "alice");
/// auto last = db.get("/restaurants", -1);
/// @endcode
class Store {
public:
    /// Construct a store. Nothing is read until the first access.
    /// @throws Exception if the options are invalid (see validate_options()).
    explicit Store(StoreOptions options, Schema schema = {});

    ~Store();

    Store(Store&&) noexcept;
    auto operator=(Store&&) noexcept -> Store&;

    Store(const Store&) = delete;
    auto operator=(const Store&) -> Store& = delete;

    // -- Configuration --------------------------------------------------------

    auto options() const -> const StoreOptions&;
    /// The schema, with every path normalized.
    auto schema() const -> const Schema&;

    /// The file the document is read from and written to.
    auto file() const -> const std::filesystem::path&;

    /// The declared shape of a path (single if undeclared).
    auto shape_of(std::string_view path) const -> Shape;

    // -- Reading --------------------------------------------------------------

    /// Get a whole entry, or one element/value of an array/dictionary.
    ///
    /// Without a locator, array and dictionary entries return the whole
    /// collection. Single entries ignore the locator.
    /// @return The value, or null if nothing is stored and
    ///   throw_on_missing is false.
    /// @throws Exception not_found if nothing is stored and
    ///   throw_on_missing is true; invalid_key for a non-simple key.
    auto get(std::string_view path, const std::optional<Locator>& locator = std::nullopt)
        -> nlohmann::json;

    /// Get a value converted with nlohmann's get<T>().
    /// @code
    /// auto name = db.get<std::string>("/teams", "alice");
    /// @endcode
    /// @return The value, or nullopt if nothing is stored and
    ///   throw_on_missing is false.
    /// @throws Exception type_mismatch if the stored value cannot be
    ///   converted to T.
    template <typename T>
    auto get(std::string_view path, const std::optional<Locator>& locator = std::nullopt)
        -> std::optional<T> {
        const auto* node = lookup(path, locator);
        if (!node) return std::nullopt;
        try {
            return node->get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw Exception{ErrorKind::type_mismatch,
                            "cannot convert the value at '" + std::string{path} + "': " + e.what()};
        }
    }

    /// Get the last element of an array entry.
    auto last(std::string_view path) -> nlohmann::json;

    /// Check whether data is stored at a path (and locator).
    auto exists(std::string_view path, const std::optional<Locator>& locator = std::nullopt)
        -> bool;

    /// Number of elements (array) or keys (object) stored at a path; 0 if
    /// nothing is stored.
    /// @throws Exception type_mismatch if the stored value is a scalar;
    ///   not_found if nothing is stored and throw_on_missing is true.
    auto count(std::string_view path) -> std::size_t;

    /// All children of the collection at a path accepted by the predicate.
    /// Missing data follows the same policy as count().
    auto filter(std::string_view path, const Predicate& predicate) -> std::vector<nlohmann::json>;

    /// The first child of the collection at a path accepted by the predicate.
    /// Missing data follows the same policy as count().
    auto find(std::string_view path, const Predicate& predicate) -> std::optional<nlohmann::json>;

    /// The whole document.
    auto data() -> const nlohmann::json&;

    // -- Writing --------------------------------------------------------------

    /// Overwrite a whole entry, or one element/value of an array/dictionary.
    void set(std::string_view path, nlohmann::json data,
             const std::optional<Locator>& locator = std::nullopt);

    /// Add data to an entry.
    ///
    /// - array: append without a locator, write at the index otherwise
    /// - dictionary: write at the key; the key is mandatory (missing_key)
    /// - single: same as set()
    void push(std::string_view path, nlohmann::json data,
              const std::optional<Locator>& locator = std::nullopt);

    /// Shallow-merge data into what is already stored.
    /// @throws Exception merge_target_missing if nothing is stored yet;
    ///   missing_index for an array entry without a locator.
    void merge(std::string_view path, nlohmann::json data,
               const std::optional<Locator>& locator = std::nullopt);

    /// Remove an entry or one element/value. Removing missing data is a no-op.
    void remove(std::string_view path, const std::optional<Locator>& locator = std::nullopt);

    /// Write an initial value if nothing is stored at the path yet.
    /// @return True if the value was written.
    auto push_if_not_exists(std::string_view path, nlohmann::json initial_value) -> bool;

    // -- Persistence ----------------------------------------------------------

    /// Load the document from disk if it is not loaded yet.
    void load();

    /// Write pending changes to disk.
    /// @param force Write even when nothing changed or nothing was loaded.
    ///   A forced save on a store that was never loaded writes the empty
    ///   document, replacing whatever the file held. Call load() first to
    ///   keep the file's content.
    void save(bool force = false);

    /// Discard the in-memory document, unsaved changes included, and load
    /// it again from disk.
    void reload();

    auto is_loaded() const -> bool;

    /// Whether there are changes not yet written to disk.
    auto is_dirty() const -> bool;

private:
    /// Resolve path and locator into parsed steps.
    auto resolve(std::string_view path, const std::optional<Locator>& locator, Access access) const
        -> std::vector<PathStep>;

    /// The node a read addresses; nullptr (or not_found) if absent.
    auto lookup(std::string_view path, const std::optional<Locator>& locator)
        -> const nlohmann::json*;

    /// Mark the document changed and save it if configured to.
    void commit();

    auto children(std::string_view path, const Predicate& predicate, bool first_only)
        -> std::vector<nlohmann::json>;

    StoreOptions options_;
    Schema schema_;
    std::unique_ptr<detail::DocumentFile> file_;
};

}  // namespace jsondb_cpp

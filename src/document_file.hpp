#pragma once

// Internal header — not installed. Owns the in-memory document of a Store
// and its backing file.

#include <nlohmann/json.hpp>

#include <filesystem>

namespace jsondb_cpp::detail {

// Lifecycle: Unloaded --load()/document()--> Loaded --reload()--> Loaded.
// Mutations are made through document() and announced with mark_dirty();
// save() writes the document only when it is dirty (or when forced).
class DocumentFile {
public:
    DocumentFile(std::filesystem::path file, bool human_readable);

    // The document, loading it from disk on first access.
    auto document() -> nlohmann::json&;

    // Read the file if not yet loaded. A missing file yields {}.
    void load();

    // Discard the in-memory document (including unsaved changes) and load again.
    void reload();

    // Write the document through a temporary file renamed over the target.
    // Throws not_loaded when unloaded and not forced, io_failure on write
    // errors; on failure the document stays dirty.
    void save(bool force);

    void mark_dirty() noexcept { dirty_ = true; }

    auto is_loaded() const noexcept -> bool { return loaded_; }
    auto is_dirty() const noexcept -> bool { return dirty_; }
    auto path() const noexcept -> const std::filesystem::path& { return file_; }

private:
    auto read_file() const -> nlohmann::json;
    void write_file(const nlohmann::json& doc) const;

    std::filesystem::path file_;
    bool human_readable_;
    nlohmann::json doc_ = nlohmann::json::object();
    bool loaded_ = false;
    bool dirty_ = false;
};

}  // namespace jsondb_cpp::detail

#include "document_file.hpp"

#include <jsondb-cpp/error.hpp>
#include <jsondb-cpp/log.hpp>

#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace jsondb_cpp::detail {

namespace {

constexpr int pretty_indent = 4;

auto temporary_path(const std::filesystem::path& file) -> std::filesystem::path {
    auto tmp = file;
    tmp += ".tmp";
    return tmp;
}

}  // anonymous namespace

DocumentFile::DocumentFile(std::filesystem::path file, bool human_readable)
    : file_{std::move(file)}, human_readable_{human_readable} {}

auto DocumentFile::document() -> nlohmann::json& {
    load();
    return doc_;
}

void DocumentFile::load() {
    if (loaded_) return;
    doc_ = read_file();
    loaded_ = true;
    dirty_ = false;
}

void DocumentFile::reload() {
    if (dirty_) {
        JSONDB_LOG_WARN("reloading {} discards unsaved changes", file_.string());
    }
    loaded_ = false;
    dirty_ = false;
    doc_ = nlohmann::json::object();
    load();
}

void DocumentFile::save(bool force) {
    if (!loaded_ && !force) {
        throw Exception{ErrorKind::not_loaded,
                        "document " + file_.string() + " is not loaded, refusing to write it"};
    }
    if (!dirty_ && !force) return;
    if (!loaded_) {
        auto ec = std::error_code{};
        if (std::filesystem::exists(file_, ec)) {
            JSONDB_LOG_WARN("forced save of unloaded {} replaces its content with {{}}", file_.string());
        }
    }
    write_file(doc_);
    dirty_ = false;
}

auto DocumentFile::read_file() const -> nlohmann::json {
    auto ec = std::error_code{};
    const auto status = std::filesystem::status(file_, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        JSONDB_LOG_INFO("{} does not exist, starting with an empty document", file_.string());
        return nlohmann::json::object();
    }
    if (ec) {
        JSONDB_LOG_ERROR("cannot stat {}: {}", file_.string(), ec.message());
        throw Exception{ErrorKind::io_failure, "cannot access " + file_.string() + ": " + ec.message()};
    }
    if (status.type() != std::filesystem::file_type::regular) {
        throw Exception{ErrorKind::io_failure, file_.string() + " is not a regular file"};
    }

    auto in = std::ifstream{file_, std::ios::binary};
    if (!in) {
        JSONDB_LOG_ERROR("cannot open {} for reading", file_.string());
        throw Exception{ErrorKind::io_failure, "cannot open " + file_.string() + " for reading"};
    }
    auto doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        JSONDB_LOG_ERROR("{} does not contain valid JSON", file_.string());
        throw Exception{ErrorKind::parse_error, file_.string() + " does not contain valid JSON"};
    }
    JSONDB_LOG_DEBUG("loaded {}", file_.string());
    return doc;
}

void DocumentFile::write_file(const nlohmann::json& doc) const {
    auto text = std::string{};
    try {
        text = doc.dump(human_readable_ ? pretty_indent : -1);
    } catch (const nlohmann::json::type_error& e) {
        throw Exception{ErrorKind::io_failure, std::string{"cannot serialize document: "} + e.what()};
    }

    auto ec = std::error_code{};
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
        if (ec) {
            JSONDB_LOG_ERROR("cannot create directory for {}: {}", file_.string(), ec.message());
            throw Exception{ErrorKind::io_failure,
                            "cannot create directory " + file_.parent_path().string() + ": " + ec.message()};
        }
    }

    const auto tmp = temporary_path(file_);
    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        out << text;
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmp, ec);
            JSONDB_LOG_ERROR("cannot write {}", tmp.string());
            throw Exception{ErrorKind::io_failure, "cannot write " + tmp.string()};
        }
    }

    std::filesystem::rename(tmp, file_, ec);
    if (ec) {
        const auto message = ec.message();
        std::filesystem::remove(tmp, ec);
        JSONDB_LOG_ERROR("cannot replace {}: {}", file_.string(), message);
        throw Exception{ErrorKind::io_failure, "cannot replace " + file_.string() + ": " + message};
    }
    JSONDB_LOG_DEBUG("saved {} ({} bytes)", file_.string(), text.size());
}

}  // namespace jsondb_cpp::detail

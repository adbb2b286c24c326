// document_file_test.cpp — Tests for loading and saving the backing file

#include "document_file.hpp"
#include "temp_dir.hpp"

#include <jsondb-cpp/error.hpp>
#include <jsondb-cpp/log.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace jdb = jsondb_cpp;
using json = nlohmann::json;
using jsondb_test::TempDir;
using jsondb_test::read_text;
using jsondb_test::write_text;

// -- Loading ------------------------------------------------------------------

TEST(DocumentFile, starts_unloaded) {
    const auto dir = TempDir{};
    const auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    EXPECT_FALSE(file.is_loaded());
    EXPECT_FALSE(file.is_dirty());
}

TEST(DocumentFile, missing_file_loads_as_empty_object) {
    const auto dir = TempDir{};
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    EXPECT_EQ(file.document(), json::object());
    EXPECT_TRUE(file.is_loaded());
    EXPECT_FALSE(std::filesystem::exists(dir.file("db.json")));
}

TEST(DocumentFile, loads_existing_content) {
    const auto dir = TempDir{};
    write_text(dir.file("db.json"), R"({"login": {"username": "a"}})");
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    file.load();
    EXPECT_EQ(file.document()["login"]["username"], "a");
}

TEST(DocumentFile, malformed_json_is_parse_error) {
    const auto dir = TempDir{};
    write_text(dir.file("db.json"), R"({"login": )");
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    try {
        file.load();
        FAIL() << "expected parse_error";
    } catch (const jdb::Exception& e) {
        EXPECT_EQ(e.kind(), jdb::ErrorKind::parse_error);
    }
    EXPECT_FALSE(file.is_loaded());
}

TEST(DocumentFile, directory_is_io_failure) {
    const auto dir = TempDir{};
    std::filesystem::create_directories(dir.file("db.json"));
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    try {
        file.load();
        FAIL() << "expected io_failure";
    } catch (const jdb::Exception& e) {
        EXPECT_EQ(e.kind(), jdb::ErrorKind::io_failure);
    }
}

// -- Saving -------------------------------------------------------------------

TEST(DocumentFile, save_before_load_is_refused) {
    const auto dir = TempDir{};
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    try {
        file.save(false);
        FAIL() << "expected not_loaded";
    } catch (const jdb::Exception& e) {
        EXPECT_EQ(e.kind(), jdb::ErrorKind::not_loaded);
    }
    EXPECT_FALSE(std::filesystem::exists(dir.file("db.json")));
}

TEST(DocumentFile, forced_save_before_load_writes_empty_document) {
    const auto dir = TempDir{};
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    file.save(true);
    EXPECT_EQ(json::parse(read_text(dir.file("db.json"))), json::object());
}

TEST(DocumentFile, forced_save_before_load_replaces_existing_file) {
    const auto dir = TempDir{};
    write_text(dir.file("db.json"), R"({"login": {"username": "a"}})");
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};

    const auto saved_level = jdb::log_level();
    jdb::set_log_level(jdb::LogLevel::warning);
    ::testing::internal::CaptureStderr();
    file.save(true);
    const auto output = ::testing::internal::GetCapturedStderr();
    jdb::set_log_level(saved_level);

    EXPECT_NE(output.find("[WARNING]"), std::string::npos);
    EXPECT_NE(output.find("replaces its content"), std::string::npos);
    EXPECT_EQ(json::parse(read_text(dir.file("db.json"))), json::object());
}

TEST(DocumentFile, forced_save_after_load_keeps_content) {
    const auto dir = TempDir{};
    write_text(dir.file("db.json"), R"({"login": {"username": "a"}})");
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    file.load();
    file.save(true);
    EXPECT_EQ(json::parse(read_text(dir.file("db.json")))["login"]["username"], "a");
}

TEST(DocumentFile, clean_document_is_not_written) {
    const auto dir = TempDir{};
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    file.load();
    file.save(false);
    EXPECT_FALSE(std::filesystem::exists(dir.file("db.json")));
}

TEST(DocumentFile, dirty_document_is_written_compact) {
    const auto dir = TempDir{};
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    file.document()["a"] = json{1, 2};
    file.mark_dirty();
    file.save(false);

    EXPECT_FALSE(file.is_dirty());
    EXPECT_EQ(read_text(dir.file("db.json")), R"({"a":[1,2]})");
    EXPECT_FALSE(std::filesystem::exists(dir.file("db.json.tmp")));
}

TEST(DocumentFile, human_readable_is_indented) {
    const auto dir = TempDir{};
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), true};
    file.document()["a"] = 1;
    file.mark_dirty();
    file.save(false);
    EXPECT_EQ(read_text(dir.file("db.json")), "{\n    \"a\": 1\n}");
}

TEST(DocumentFile, save_creates_parent_directories) {
    const auto dir = TempDir{};
    const auto path = dir.path() / "nested" / "deeper" / "db.json";
    auto file = jdb::detail::DocumentFile{path, false};
    file.document()["a"] = true;
    file.mark_dirty();
    file.save(false);
    EXPECT_EQ(json::parse(read_text(path)), json({{"a", true}}));
}

TEST(DocumentFile, failed_save_keeps_changes_and_file) {
    const auto dir = TempDir{};
    write_text(dir.file("db.json"), R"({"a": 1})");
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    file.document()["a"] = 2;
    file.mark_dirty();

    // A directory in the way of the temporary file makes the write fail.
    std::filesystem::create_directories(dir.file("db.json.tmp"));
    try {
        file.save(false);
        FAIL() << "expected io_failure";
    } catch (const jdb::Exception& e) {
        EXPECT_EQ(e.kind(), jdb::ErrorKind::io_failure);
    }

    EXPECT_TRUE(file.is_dirty());
    EXPECT_EQ(file.document()["a"], 2);
    EXPECT_EQ(json::parse(read_text(dir.file("db.json"))), json({{"a", 1}}));

    std::filesystem::remove_all(dir.file("db.json.tmp"));
    file.save(false);
    EXPECT_EQ(json::parse(read_text(dir.file("db.json"))), json({{"a", 2}}));
}

// -- Reloading ----------------------------------------------------------------

TEST(DocumentFile, reload_discards_unsaved_changes) {
    const auto dir = TempDir{};
    write_text(dir.file("db.json"), R"({"a": 1})");
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    file.document()["a"] = 2;
    file.mark_dirty();

    file.reload();
    EXPECT_FALSE(file.is_dirty());
    EXPECT_EQ(file.document()["a"], 1);
}

TEST(DocumentFile, reload_sees_external_changes) {
    const auto dir = TempDir{};
    write_text(dir.file("db.json"), R"({"a": 1})");
    auto file = jdb::detail::DocumentFile{dir.file("db.json"), false};
    file.load();
    write_text(dir.file("db.json"), R"({"a": 3})");

    EXPECT_EQ(file.document()["a"], 1);
    file.reload();
    EXPECT_EQ(file.document()["a"], 3);
}

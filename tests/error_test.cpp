#include <jsondb-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace jsondb_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::not_found),            "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_key),          "invalid_key");
    EXPECT_EQ(to_string_view(ErrorKind::missing_key),          "missing_key");
    EXPECT_EQ(to_string_view(ErrorKind::missing_index),        "missing_index");
    EXPECT_EQ(to_string_view(ErrorKind::merge_target_missing), "merge_target_missing");
    EXPECT_EQ(to_string_view(ErrorKind::index_out_of_range),   "index_out_of_range");
    EXPECT_EQ(to_string_view(ErrorKind::io_failure),           "io_failure");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_path),         "invalid_path");
    EXPECT_EQ(to_string_view(ErrorKind::type_mismatch),        "type_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::not_loaded),           "not_loaded");
    EXPECT_EQ(to_string_view(ErrorKind::parse_error),          "parse_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::invalid_key, "bad key"};
    const auto e2 = Error{ErrorKind::invalid_key, "bad key"};
    const auto e3 = Error{ErrorKind::missing_key, "bad key"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::io_failure, "foo"};
    const auto e2 = Error{ErrorKind::io_failure, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Exception, carries_kind_and_message) {
    const auto ex = Exception{ErrorKind::merge_target_missing, "nothing at /login"};

    EXPECT_EQ(ex.kind(), ErrorKind::merge_target_missing);
    EXPECT_EQ(ex.error().message, "nothing at /login");
    EXPECT_EQ(std::string{ex.what()}, "merge_target_missing: nothing at /login");
}

TEST(Exception, is_a_runtime_error) {
    try {
        throw Exception{ErrorKind::not_found, "gone"};
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "not_found: gone");
        return;
    }
    FAIL() << "Exception was not caught as std::runtime_error";
}

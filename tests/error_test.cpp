#include <litdocx/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace litdocx;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::structural_error), "structural_error");
    EXPECT_EQ(to_string_view(ErrorKind::markup_error),     "markup_error");
    EXPECT_EQ(to_string_view(ErrorKind::catalog_error),    "catalog_error");
    EXPECT_EQ(to_string_view(ErrorKind::archive_error),    "archive_error");
    EXPECT_EQ(to_string_view(ErrorKind::config_error),     "config_error");
    EXPECT_EQ(to_string_view(ErrorKind::io_error),         "io_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::structural_error, "bad tag"};
    const auto e2 = Error{ErrorKind::structural_error, "bad tag"};
    const auto e3 = Error{ErrorKind::markup_error, "bad tag"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::catalog_error, "foo"};
    const auto e2 = Error{ErrorKind::catalog_error, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(ConversionError, carries_kind_and_message) {
    const auto e = ConversionError{ErrorKind::archive_error, "not a zip"};

    EXPECT_EQ(e.kind(), ErrorKind::archive_error);
    EXPECT_EQ(e.error().message, "not a zip");
    EXPECT_STREQ(e.what(), "not a zip");
}

TEST(ConversionError, is_a_runtime_error) {
    try {
        throw ConversionError{Error{ErrorKind::io_error, "cannot open x"}};
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "cannot open x");
        return;
    }
    FAIL() << "ConversionError was not caught as std::runtime_error";
}

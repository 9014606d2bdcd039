#include <litdocx/error.hpp>
#include <litdocx/options.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace litdocx;

namespace {

class LoadOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string{"litdocx_options_"} + info->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        auto ec = std::error_code{};
        std::filesystem::remove_all(dir_, ec);
    }

    auto write(const std::string& name, const std::string& contents) -> std::filesystem::path {
        auto path = dir_ / name;
        auto out = std::ofstream{path, std::ios::binary};
        out << contents;
        return path;
    }

    std::filesystem::path dir_;
};

auto load_kind(const std::filesystem::path& path) -> ErrorKind {
    try {
        load_options(path);
    } catch (const ConversionError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ConversionError for " << path.string();
    return ErrorKind::structural_error;
}

}  // anonymous namespace

TEST_F(LoadOptionsTest, reads_values) {
    auto path = write("options.json", R"({
        "marker": "#>",
        "bullet_abstract_num_id": 4,
        "ordered_template_abstract_num_id": 9,
        "emphasize_terms": false,
        "styles": {"heading_prefix": "Titre", "ordered_list": "Steps"}
    })");
    auto options = load_options(path);

    EXPECT_EQ(options.marker, "#>");
    EXPECT_EQ(options.bullet_abstract_num_id, 4);
    EXPECT_EQ(options.ordered_template_abstract_num_id, 9);
    EXPECT_FALSE(options.emphasize_terms);
    EXPECT_EQ(options.styles.heading_prefix, "Titre");
    EXPECT_EQ(options.styles.ordered_list, "Steps");
    EXPECT_EQ(options.styles.bullet_list, StyleNames{}.bullet_list);
    EXPECT_EQ(options.code_font, Options{}.code_font);
}

TEST_F(LoadOptionsTest, empty_object_gives_defaults) {
    EXPECT_EQ(load_options(write("empty.json", "{}")), Options{});
}

TEST_F(LoadOptionsTest, missing_file_is_an_io_error) {
    EXPECT_EQ(load_kind(dir_ / "absent.json"), ErrorKind::io_error);
}

TEST_F(LoadOptionsTest, malformed_json_is_a_config_error) {
    EXPECT_EQ(load_kind(write("bad.json", "{\"marker\": ")), ErrorKind::config_error);
}

TEST_F(LoadOptionsTest, wrong_type_is_a_config_error) {
    EXPECT_EQ(load_kind(write("typed.json", R"({"bullet_abstract_num_id": "one"})")),
              ErrorKind::config_error);
}

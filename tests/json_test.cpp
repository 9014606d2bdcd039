// json_test.cpp - Tests for nlohmann/json interoperability

#include <litdocx/error.hpp>
#include <litdocx/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace litdocx;
using json = nlohmann::json;

// =============================================================================
// Markup tree
// =============================================================================

TEST(JsonMarkup, node_serializes_without_empty_members) {
    auto node = make_node(Tag::paragraph, "a ", {make_node(Tag::emphasis, "b", {}, " c")});
    auto expected = json::parse(R"({
        "tag": "p",
        "text": "a ",
        "children": [{"tag": "em", "text": "b", "tail": " c"}]
    })");
    EXPECT_EQ(json(node), expected);
}

TEST(JsonMarkup, attributes_are_kept) {
    auto node = make_node(Tag::ordered_list);
    node.attributes["start"] = "3";
    EXPECT_EQ(json(node)["attributes"], (json{{"start", "3"}}));
}

TEST(JsonMarkup, node_round_trips) {
    auto node = make_node(Tag::document, {}, {
        make_node(Tag::heading1, "Title"),
        make_node(Tag::paragraph, "x ", {make_node(Tag::code, "y", {}, " z")}),
    });
    EXPECT_EQ(json(node).get<MarkupNode>(), node);
}

TEST(JsonMarkup, unknown_tag_is_a_structural_error) {
    try {
        json::parse(R"({"tag": "table"})").get<MarkupNode>();
        FAIL() << "expected ConversionError";
    } catch (const ConversionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::structural_error);
    }
}

// =============================================================================
// Document model
// =============================================================================

TEST(JsonDocument, run_segments_and_attributes) {
    auto run = make_preformatted_run("a\tb", RunAttributes{.code = true});
    auto expected = json::parse(R"({
        "segments": ["a", {"type": "tab"}, "b"],
        "attributes": {"code": true}
    })");
    EXPECT_EQ(json(run), expected);
}

TEST(JsonDocument, plain_run_omits_attributes) {
    EXPECT_FALSE(json(make_run("x")).contains("attributes"));
}

TEST(JsonDocument, paragraph_with_numbering) {
    auto p = Paragraph{};
    p.runs.push_back(make_run("item"));
    p.style = "Alg4";
    p.numbering = NumberingRef{4, 1};

    auto j = json(p);
    EXPECT_EQ(j["style"], "Alg4");
    EXPECT_EQ(j["numbering"], (json{{"num_id", 4}, {"level", 1}}));
    EXPECT_EQ(j["runs"].size(), 1u);
}

TEST(JsonDocument, conversion_result) {
    auto result = ConversionResult{};
    result.numbering.push_back(NumberingPair{2, 1});
    auto j = json(result);
    EXPECT_EQ(j["document"], (json{{"paragraphs", json::array()}}));
    EXPECT_EQ(j["numbering"], json::parse(R"([{"num_id": 2, "abstract_num_id": 1}])"));
}

// =============================================================================
// Options
// =============================================================================

TEST(JsonOptions, defaults_round_trip) {
    EXPECT_EQ(json(Options{}).get<Options>(), Options{});
}

TEST(JsonOptions, missing_keys_keep_defaults) {
    auto options = json::parse(R"({"code_font": "Consolas", "styles": {"note": "Aside"}})")
                       .get<Options>();
    EXPECT_EQ(options.code_font, "Consolas");
    EXPECT_EQ(options.styles.note, "Aside");
    EXPECT_EQ(options.styles.code_block, StyleNames{}.code_block);
    EXPECT_EQ(options.marker, "//>");
}

TEST(JsonOptions, unknown_keys_are_ignored) {
    EXPECT_EQ(json::parse(R"({"colour": "blue"})").get<Options>(), Options{});
}

TEST(JsonOptions, ordered_template_may_be_null) {
    auto options = json::parse(R"({"ordered_template_abstract_num_id": 12})").get<Options>();
    EXPECT_EQ(options.ordered_template_abstract_num_id, 12);

    options = json::parse(R"({"ordered_template_abstract_num_id": null})").get<Options>();
    EXPECT_FALSE(options.ordered_template_abstract_num_id.has_value());
}

TEST(JsonOptions, invalid_values_are_config_errors) {
    for (const auto* text : {
             R"([1, 2])",
             R"({"marker": 5})",
             R"({"marker": ""})",
             R"({"bullet_abstract_num_id": -1})",
             R"({"emphasize_terms": "yes"})",
             R"({"styles": []})",
             R"({"styles": {"note": false}})",
         }) {
        try {
            json::parse(text).get<Options>();
            ADD_FAILURE() << "accepted " << text;
        } catch (const ConversionError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::config_error) << text;
        }
    }
}

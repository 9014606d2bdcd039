#include <litdocx/term_emphasis.hpp>

#include <gtest/gtest.h>

using namespace litdocx;

using Terms = std::set<std::string>;

// -- collect_terms ------------------------------------------------------------

TEST(CollectTerms, words_of_heading_parameter_list) {
    EXPECT_EQ(collect_terms("## Foo (bar, baz)\n", ""), (Terms{"bar", "baz"}));
}

TEST(CollectTerms, only_first_parenthesized_group) {
    EXPECT_EQ(collect_terms("## Foo (a) (b)\n", ""), (Terms{"a"}));
}

TEST(CollectTerms, heading_without_parameters) {
    EXPECT_TRUE(collect_terms("# Introduction\n", "").empty());
}

TEST(CollectTerms, let_be_declarations) {
    EXPECT_EQ(collect_terms("## Step\n", "1. Let m be the module.\n2. let x be 3.\n"),
              (Terms{"m", "x"}));
}

TEST(CollectTerms, called_on_an_object) {
    EXPECT_EQ(collect_terms("## Call\n", "When called on an object O, do this.\n"),
              (Terms{"O"}));
}

// -- emphasize_section --------------------------------------------------------

TEST(EmphasizeSection, standalone_mentions_only) {
    EXPECT_EQ(emphasize_section("bar and barred and baz.", Terms{"bar", "baz"}),
              "*bar* and barred and *baz*.");
}

TEST(EmphasizeSection, code_spans_are_left_alone) {
    EXPECT_EQ(emphasize_section("`bar` and bar", Terms{"bar"}), "`bar` and *bar*");
}

TEST(EmphasizeSection, existing_emphasis_is_left_alone) {
    EXPECT_EQ(emphasize_section("*bar* and **bar**", Terms{"bar"}), "*bar* and **bar**");
}

TEST(EmphasizeSection, bullet_marker_is_not_emphasis) {
    EXPECT_EQ(emphasize_section("* use bar\n", Terms{"bar"}), "* use *bar*\n");
}

TEST(EmphasizeSection, the_this_value_becomes_strong) {
    EXPECT_EQ(emphasize_section("Return the this value.", Terms{}),
              "Return the **this** value.");
}

TEST(EmphasizeSection, longer_terms_win_over_prefixes) {
    EXPECT_EQ(emphasize_section("len and length", Terms{"len", "length"}),
              "*len* and *length*");
}

TEST(EmphasizeSection, fenced_code_is_left_alone) {
    EXPECT_EQ(emphasize_section("use bar\n```\nbar = 1;\n```\nthen bar\n", Terms{"bar"}),
              "use *bar*\n```\nbar = 1;\n```\nthen *bar*\n");
    EXPECT_EQ(emphasize_section("~~~~\nbar\n~~~\nbar\n", Terms{"bar"}),
              "~~~~\nbar\n~~~\nbar\n");
}

TEST(EmphasizeSection, indented_code_is_left_alone) {
    EXPECT_EQ(emphasize_section("see bar:\n\n    bar();\n\nbar\n", Terms{"bar"}),
              "see *bar*:\n\n    bar();\n\n*bar*\n");
}

TEST(EmphasizeSection, indented_list_continuation_is_prose) {
    EXPECT_EQ(emphasize_section("- first\n\n    bar here\n", Terms{"bar"}),
              "- first\n\n    *bar* here\n");
}

TEST(EmphasizeSection, no_terms_leaves_text_unchanged) {
    EXPECT_EQ(emphasize_section("plain text", Terms{}), "plain text");
}

// -- emphasize_terms ----------------------------------------------------------

TEST(EmphasizeTerms, preamble_is_untouched) {
    EXPECT_EQ(emphasize_terms("intro bar\n## F (bar)\nuse bar\n"),
              "intro bar\n## F (bar)\nuse *bar*\n");
}

TEST(EmphasizeTerms, terms_are_scoped_to_their_section) {
    EXPECT_EQ(emphasize_terms("## A (x)\nx\n## B\nx\n"), "## A (x)\n*x*\n## B\nx\n");
}

TEST(EmphasizeTerms, let_terms_apply_in_section) {
    EXPECT_EQ(emphasize_terms("## Load\nLet m be the module. Return m.\n"),
              "## Load\nLet *m* be the module. Return *m*.\n");
}

TEST(EmphasizeTerms, code_blocks_in_a_section_are_untouched) {
    EXPECT_EQ(emphasize_terms("## Foo (bar)\nCall bar.\n```\nbar = 1;\n```\n\n    bar();\n"),
              "## Foo (bar)\nCall *bar*.\n```\nbar = 1;\n```\n\n    bar();\n");
}

TEST(EmphasizeTerms, hash_line_inside_a_fence_is_not_a_heading) {
    EXPECT_EQ(emphasize_terms("## F (x)\n```\n# x\n```\nx\n"),
              "## F (x)\n```\n# x\n```\n*x*\n");
}

TEST(EmphasizeTerms, empty_source) {
    EXPECT_EQ(emphasize_terms(""), "");
}

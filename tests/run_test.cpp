#include <litdocx/run.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace litdocx;

namespace {

auto text(std::string s) -> Segment { return TextSegment{std::move(s)}; }

}  // anonymous namespace

// -- make_run -----------------------------------------------------------------

TEST(MakeRun, collapses_interior_whitespace) {
    auto run = make_run("a  b\t\tc\r\n d\v e");
    EXPECT_EQ(run.segments, (std::vector<Segment>{text("a b c d e")}));
}

TEST(MakeRun, keeps_boundary_whitespace_collapsed) {
    auto run = make_run("  hello \n ");
    EXPECT_EQ(run.segments, (std::vector<Segment>{text(" hello ")}));
    EXPECT_TRUE(run.starts_with_space());
    EXPECT_TRUE(run.ends_with_space());
}

TEST(MakeRun, newline_is_ordinary_whitespace) {
    auto run = make_run("one\ntwo");
    EXPECT_EQ(run.segments, (std::vector<Segment>{text("one two")}));
}

TEST(MakeRun, form_feed_becomes_page_break) {
    auto run = make_run("before\fafter");
    EXPECT_EQ(run.segments,
              (std::vector<Segment>{text("before"), PageBreak{}, text("after")}));
}

TEST(MakeRun, empty_text_gives_empty_run) {
    EXPECT_TRUE(make_run("").empty());
}

TEST(MakeRun, carries_attributes) {
    auto run = make_run("x", RunAttributes{true, false, true});
    EXPECT_TRUE(run.attributes.emphasis);
    EXPECT_FALSE(run.attributes.strong);
    EXPECT_TRUE(run.attributes.code);
}

TEST(MakeRun, text_concatenates_text_segments) {
    auto run = make_run("a\fb");
    EXPECT_EQ(run.text(), "ab");
}

// -- make_preformatted_run ----------------------------------------------------

TEST(MakePreformattedRun, keeps_whitespace_verbatim) {
    auto run = make_preformatted_run("x  =  1;");
    EXPECT_EQ(run.segments, (std::vector<Segment>{text("x  =  1;")}));
}

TEST(MakePreformattedRun, splits_breaks_and_tabs) {
    auto run = make_preformatted_run("a\nb\fc\td");
    EXPECT_EQ(run.segments, (std::vector<Segment>{
        text("a"), LineBreak{}, text("b"), PageBreak{}, text("c"), Tab{}, text("d"),
    }));
}

TEST(MakePreformattedRun, consecutive_newlines_give_consecutive_breaks) {
    auto run = make_preformatted_run("a\n\nb");
    EXPECT_EQ(run.segments,
              (std::vector<Segment>{text("a"), LineBreak{}, LineBreak{}, text("b")}));
}

TEST(MakePageBreakRun, holds_a_single_page_break) {
    auto run = make_page_break_run();
    EXPECT_EQ(run.segments, (std::vector<Segment>{PageBreak{}}));
    EXPECT_EQ(run.attributes, RunAttributes{});
}

// -- preserve_space -----------------------------------------------------------

TEST(TextSegment, preserve_space_only_for_boundary_whitespace) {
    EXPECT_TRUE((TextSegment{" a"}.preserve_space()));
    EXPECT_TRUE((TextSegment{"a "}.preserve_space()));
    EXPECT_TRUE((TextSegment{"\ta"}.preserve_space()));
    EXPECT_FALSE((TextSegment{"a b"}.preserve_space()));
    EXPECT_FALSE((TextSegment{""}.preserve_space()));
}

// -- NOTE rule ----------------------------------------------------------------

TEST(MarkNote, rewrites_leading_note_prefix) {
    auto run = make_run("NOTE The hook is complex.");
    EXPECT_TRUE(mark_note(run));
    EXPECT_EQ(run.segments,
              (std::vector<Segment>{text("NOTE"), Tab{}, text("The hook is complex.")}));
    EXPECT_TRUE(is_note_run(run));
}

TEST(MarkNote, ignores_other_text) {
    auto run = make_run("NOTES are not notes");
    EXPECT_FALSE(mark_note(run));
    EXPECT_FALSE(is_note_run(run));

    auto lower = make_run("note this");
    EXPECT_FALSE(mark_note(lower));
}

TEST(MarkNote, bare_prefix_leaves_only_the_tab) {
    auto run = make_run("NOTE ");
    EXPECT_TRUE(mark_note(run));
    EXPECT_EQ(run.segments, (std::vector<Segment>{text("NOTE"), Tab{}}));
}

// -- Trimming -----------------------------------------------------------------

TEST(Trim, leading_and_trailing_space) {
    auto run = make_run(" word ");
    trim_leading_space(run);
    EXPECT_EQ(run.segments, (std::vector<Segment>{text("word ")}));
    trim_trailing_space(run);
    EXPECT_EQ(run.segments, (std::vector<Segment>{text("word")}));
}

TEST(Trim, whitespace_only_run_becomes_empty) {
    auto run = make_run("   ");
    trim_leading_space(run);
    EXPECT_TRUE(run.empty());
}

TEST(Trim, break_segments_are_untouched) {
    auto run = make_run("\fx");
    trim_leading_space(run);
    EXPECT_EQ(run.segments, (std::vector<Segment>{PageBreak{}, text("x")}));
}

/// @file run.hpp
/// @brief Runs: the smallest styled unit of text in the output document.

#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace litdocx {

/// Character formatting carried by a run.
struct RunAttributes {
    bool emphasis{false};
    bool strong{false};
    bool code{false};

    auto operator==(const RunAttributes&) const -> bool = default;
};

/// A piece of literal text inside a run.
struct TextSegment {
    std::string text;

    /// True when the text begins or ends with whitespace, which the
    /// container format drops unless told to preserve it.
    auto preserve_space() const -> bool;

    auto operator==(const TextSegment&) const -> bool = default;
};

/// A hard line break inside a paragraph.
struct LineBreak {
    auto operator==(const LineBreak&) const -> bool = default;
};

/// A page break.
struct PageBreak {
    auto operator==(const PageBreak&) const -> bool = default;
};

/// A tab character.
struct Tab {
    auto operator==(const Tab&) const -> bool = default;
};

/// One typed element of a run.
using Segment = std::variant<TextSegment, LineBreak, PageBreak, Tab>;

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const TextSegment& t) { std::printf("%s", t.text.c_str()); },
///     [](LineBreak) { std::printf("\n"); },
///     [](auto&&) {},
/// }, segment);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// An ordered sequence of segments sharing one set of attributes.
struct Run {
    std::vector<Segment> segments;
    RunAttributes attributes;

    /// Concatenated text of all text segments; breaks and tabs are skipped.
    auto text() const -> std::string;

    /// True when there are no segments at all.
    auto empty() const -> bool { return segments.empty(); }

    /// True when the first segment is text starting with whitespace.
    auto starts_with_space() const -> bool;

    /// True when the last segment is text ending with whitespace.
    auto ends_with_space() const -> bool;

    auto operator==(const Run&) const -> bool = default;
};

/// Build a run from markup text.
///
/// Every run of whitespace collapses to a single space. Whitespace at the
/// start or end of the text is collapsed, not removed, so the word gap
/// between adjacent runs survives. Newlines are ordinary whitespace here;
/// form feeds are not, and become PageBreak segments. Empty text pieces are
/// dropped.
auto make_run(std::string_view text, RunAttributes attrs = {}) -> Run;

/// Build a run whose whitespace is kept verbatim.
///
/// Newlines become LineBreak, form feeds PageBreak and tabs Tab segments.
auto make_preformatted_run(std::string_view text, RunAttributes attrs = {}) -> Run;

/// Build a run holding a single page break.
auto make_page_break_run() -> Run;

/// Rewrite a leading "NOTE " as "NOTE" followed by a tab segment.
/// @return true when the run was rewritten.
auto mark_note(Run& run) -> bool;

/// True when the run starts with the text "NOTE" immediately followed by a tab.
auto is_note_run(const Run& run) -> bool;

/// Remove leading whitespace from the first text segment.
void trim_leading_space(Run& run);

/// Remove trailing whitespace from the last text segment.
void trim_trailing_space(Run& run);

}  // namespace litdocx

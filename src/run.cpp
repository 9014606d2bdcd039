#include <litdocx/run.hpp>

#include <string>
#include <utility>

namespace litdocx {

namespace {

constexpr std::string_view note_prefix = "NOTE ";

// Form feed is absent: it carries a page break.
constexpr auto is_collapsible_space(char c) noexcept -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v';
}

constexpr auto is_space(char c) noexcept -> bool {
    return is_collapsible_space(c) || c == '\f';
}

// Collapse each run of whitespace to one space. Boundary whitespace is
// collapsed too, never trimmed: it separates this text from its neighbours.
auto collapse_whitespace(std::string_view text) -> std::string {
    auto result = std::string{};
    result.reserve(text.size());
    auto in_space = false;
    for (auto c : text) {
        if (is_collapsible_space(c)) {
            if (!in_space) result.push_back(' ');
            in_space = true;
        } else {
            result.push_back(c);
            in_space = false;
        }
    }
    return result;
}

// Split text on control characters, appending typed segments.
void split_segments(std::string_view text, bool split_tabs, std::vector<Segment>& out) {
    auto pending = std::string{};
    auto flush = [&] {
        if (!pending.empty()) {
            out.emplace_back(TextSegment{std::move(pending)});
            pending.clear();
        }
    };
    for (auto c : text) {
        if (c == '\n') {
            flush();
            out.emplace_back(LineBreak{});
        } else if (c == '\f') {
            flush();
            out.emplace_back(PageBreak{});
        } else if (c == '\t' && split_tabs) {
            flush();
            out.emplace_back(Tab{});
        } else {
            pending.push_back(c);
        }
    }
    flush();
}

}  // anonymous namespace

auto TextSegment::preserve_space() const -> bool {
    return !text.empty() && (is_space(text.front()) || is_space(text.back()));
}

auto Run::text() const -> std::string {
    auto result = std::string{};
    for (const auto& seg : segments) {
        if (const auto* t = std::get_if<TextSegment>(&seg)) result += t->text;
    }
    return result;
}

auto Run::starts_with_space() const -> bool {
    if (segments.empty()) return false;
    const auto* t = std::get_if<TextSegment>(&segments.front());
    return t && !t->text.empty() && is_space(t->text.front());
}

auto Run::ends_with_space() const -> bool {
    if (segments.empty()) return false;
    const auto* t = std::get_if<TextSegment>(&segments.back());
    return t && !t->text.empty() && is_space(t->text.back());
}

auto make_run(std::string_view text, RunAttributes attrs) -> Run {
    auto run = Run{{}, attrs};
    split_segments(collapse_whitespace(text), false, run.segments);
    return run;
}

auto make_preformatted_run(std::string_view text, RunAttributes attrs) -> Run {
    auto run = Run{{}, attrs};
    split_segments(text, true, run.segments);
    return run;
}

auto make_page_break_run() -> Run {
    return Run{{Segment{PageBreak{}}}, {}};
}

auto mark_note(Run& run) -> bool {
    if (run.segments.empty()) return false;
    auto* first = std::get_if<TextSegment>(&run.segments.front());
    if (!first || !first->text.starts_with(note_prefix)) return false;

    auto rest = first->text.substr(note_prefix.size());
    first->text = "NOTE";
    auto pos = run.segments.insert(run.segments.begin() + 1, Segment{Tab{}});
    if (!rest.empty()) {
        run.segments.insert(pos + 1, Segment{TextSegment{std::move(rest)}});
    }
    return true;
}

auto is_note_run(const Run& run) -> bool {
    if (run.segments.size() < 2) return false;
    const auto* first = std::get_if<TextSegment>(&run.segments[0]);
    return first && first->text == "NOTE" &&
           std::holds_alternative<Tab>(run.segments[1]);
}

void trim_leading_space(Run& run) {
    if (run.segments.empty()) return;
    auto* t = std::get_if<TextSegment>(&run.segments.front());
    if (!t) return;
    auto n = std::size_t{0};
    while (n < t->text.size() && is_collapsible_space(t->text[n])) ++n;
    t->text.erase(0, n);
    if (t->text.empty()) run.segments.erase(run.segments.begin());
}

void trim_trailing_space(Run& run) {
    if (run.segments.empty()) return;
    auto* t = std::get_if<TextSegment>(&run.segments.back());
    if (!t) return;
    auto n = t->text.size();
    while (n > 0 && is_collapsible_space(t->text[n - 1])) --n;
    t->text.erase(n);
    if (t->text.empty()) run.segments.pop_back();
}

}  // namespace litdocx

#include <litdocx/term_emphasis.hpp>

#include <boost/regex.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace litdocx {

namespace {

const auto parenthesized_group = boost::regex{R"(\(([^)]*)\))"};
const auto word_token = boost::regex{R"(\w+)"};
const auto called_on_object = boost::regex{R"(called on an object (\w+))"};
const auto let_be = boost::regex{R"(\b[Ll][Ee][Tt] (\w+) be\b)"};
const auto this_value = boost::regex{R"(\bthe this value\b)"};

// Spans whose content must not be touched: code spans, then strong and
// emphasis. The opening marker must be followed by a non-space so that a
// bullet marker is not mistaken for emphasis.
const auto protected_span = boost::regex{
    R"(`[^`\n]*`)"
    R"(|\*\*[^*\s][^*\n]*\*\*)"
    R"(|__[^_\s][^_\n]*__)"
    R"(|\*[^*\s][^*\n]*\*)"
    R"(|\b_[^_\s][^_\n]*_\b)"};

auto escape_regex(const std::string& text) -> std::string {
    static const auto special = std::string{R"(\^$.|?*+()[]{})"};
    auto result = std::string{};
    for (auto c : text) {
        if (special.find(c) != std::string::npos) result.push_back('\\');
        result.push_back(c);
    }
    return result;
}

auto term_pattern(const std::set<std::string>& terms) -> boost::regex {
    auto ordered = std::vector<std::string>(terms.begin(), terms.end());
    std::ranges::stable_sort(ordered, [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });
    auto alternation = std::string{};
    for (const auto& term : ordered) {
        if (!alternation.empty()) alternation.push_back('|');
        alternation += escape_regex(term);
    }
    return boost::regex{R"((?<![\w*])(?:)" + alternation + R"()(?![\w*]))"};
}

auto substitute_plain(const std::string& text, const boost::regex* terms) -> std::string {
    auto result = text;
    if (terms) result = boost::regex_replace(result, *terms, "*$&*");
    return boost::regex_replace(result, this_value, "the **this** value");
}

// Emphasize the prose of `text`, skipping protected spans.
auto emphasize_spans(std::string_view text, const boost::regex* terms) -> std::string {
    auto result = std::string{};
    auto last = text.begin();
    for (auto it = boost::regex_iterator<std::string_view::const_iterator>{
             text.begin(), text.end(), protected_span};
         it != boost::regex_iterator<std::string_view::const_iterator>{}; ++it) {
        const auto& span = (*it)[0];
        result += substitute_plain(std::string(last, span.first), terms);
        result.append(span.first, span.second);
        last = span.second;
    }
    result += substitute_plain(std::string(last, text.end()), terms);
    return result;
}

auto indentation(std::string_view line) -> int {
    auto columns = 0;
    for (auto c : line) {
        if (c == ' ') {
            ++columns;
        } else if (c == '\t') {
            columns += 4 - columns % 4;
        } else {
            break;
        }
    }
    return columns;
}

auto is_blank_line(std::string_view line) -> bool {
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

auto is_list_marker(std::string_view line) -> bool {
    auto rest = line.substr(std::min(line.find_first_not_of(" \t"), line.size()));
    auto marker_end = std::size_t{0};
    if (!rest.empty() && (rest[0] == '-' || rest[0] == '*' || rest[0] == '+')) {
        marker_end = 1;
    } else {
        while (marker_end < rest.size() && marker_end < 9 &&
               rest[marker_end] >= '0' && rest[marker_end] <= '9') {
            ++marker_end;
        }
        if (marker_end == 0 || marker_end >= rest.size() ||
            (rest[marker_end] != '.' && rest[marker_end] != ')')) {
            return false;
        }
        ++marker_end;
    }
    return marker_end == rest.size() || rest[marker_end] == ' ' || rest[marker_end] == '\t' ||
           rest[marker_end] == '\n' || rest[marker_end] == '\r';
}

// Tracks which lines of a markdown source belong to fenced or indented code
// blocks. Lines are fed in order; a code line is passed through verbatim.
class CodeBlockTracker {
public:
    auto is_code(std::string_view line) -> bool {
        auto indent = indentation(line);
        auto content = line.substr(std::min(line.find_first_not_of(" \t"), line.size()));

        if (fence_length_ > 0) {
            if (indent < 4 && fence_run(content, fence_char_) >= fence_length_ &&
                is_blank_line(content.substr(fence_run(content, fence_char_)))) {
                fence_length_ = 0;
            }
            return true;
        }
        if (is_blank_line(line)) {
            after_blank_ = true;
            return indented_;
        }
        if (indent < 4 && !content.empty() && (content[0] == '`' || content[0] == '~') &&
            fence_run(content, content[0]) >= 3) {
            fence_char_ = content[0];
            fence_length_ = fence_run(content, fence_char_);
            indented_ = false;
            after_blank_ = false;
            return true;
        }
        if (indent >= 4 && (indented_ || (after_blank_ && !in_list_))) {
            indented_ = true;
            after_blank_ = false;
            return true;
        }

        indented_ = false;
        if (is_list_marker(line)) {
            in_list_ = true;
        } else if (indent == 0 && after_blank_) {
            in_list_ = false;
        }
        after_blank_ = false;
        return false;
    }

private:
    static auto fence_run(std::string_view text, char c) -> std::size_t {
        return std::min(text.find_first_not_of(c), text.size());
    }

    char fence_char_{'`'};
    std::size_t fence_length_{0};
    bool indented_{false};
    bool after_blank_{true};
    bool in_list_{false};
};

template <typename F>
void for_each_line(std::string_view text, F&& f) {
    auto pos = std::size_t{0};
    while (pos < text.size()) {
        auto eol = text.find('\n', pos);
        auto next = (eol == std::string_view::npos) ? text.size() : eol + 1;
        f(pos, text.substr(pos, next - pos));
        pos = next;
    }
}

}  // anonymous namespace

auto collect_terms(std::string_view heading, std::string_view body) -> std::set<std::string> {
    auto terms = std::set<std::string>{};

    auto match = boost::match_results<std::string_view::const_iterator>{};
    if (boost::regex_search(heading.begin(), heading.end(), match, parenthesized_group)) {
        auto group = match[1];
        for (auto it = boost::regex_iterator<std::string_view::const_iterator>{
                 group.first, group.second, word_token};
             it != boost::regex_iterator<std::string_view::const_iterator>{}; ++it) {
            terms.insert((*it)[0].str());
        }
    }

    for (const auto* pattern : {&called_on_object, &let_be}) {
        for (auto it = boost::regex_iterator<std::string_view::const_iterator>{
                 body.begin(), body.end(), *pattern};
             it != boost::regex_iterator<std::string_view::const_iterator>{}; ++it) {
            terms.insert((*it)[1].str());
        }
    }
    return terms;
}

auto emphasize_section(std::string_view body, const std::set<std::string>& terms) -> std::string {
    auto pattern = std::optional<boost::regex>{};
    if (!terms.empty()) pattern = term_pattern(terms);
    const auto* terms_re = pattern ? &*pattern : nullptr;

    auto result = std::string{};
    result.reserve(body.size() + body.size() / 8);
    auto tracker = CodeBlockTracker{};
    auto prose_begin = std::size_t{0};
    for_each_line(body, [&](std::size_t offset, std::string_view line) {
        if (!tracker.is_code(line)) return;
        result += emphasize_spans(body.substr(prose_begin, offset - prose_begin), terms_re);
        result += line;
        prose_begin = offset + line.size();
    });
    result += emphasize_spans(body.substr(prose_begin), terms_re);
    return result;
}

auto emphasize_terms(std::string_view source) -> std::string {
    auto result = std::string{};
    result.reserve(source.size());

    auto heading = std::string_view{};
    auto body_begin = std::size_t{0};
    auto in_section = false;

    auto flush = [&](std::size_t body_end) {
        auto body = source.substr(body_begin, body_end - body_begin);
        if (in_section) {
            result += emphasize_section(body, collect_terms(heading, body));
        } else {
            result += body;
        }
    };

    // A '#' line inside a code block is code, not a heading.
    auto tracker = CodeBlockTracker{};
    for_each_line(source, [&](std::size_t offset, std::string_view line) {
        if (tracker.is_code(line) || line.front() != '#') return;
        flush(offset);
        heading = line;
        result += heading;
        body_begin = offset + line.size();
        in_section = true;
    });
    flush(source.size());
    return result;
}

}  // namespace litdocx

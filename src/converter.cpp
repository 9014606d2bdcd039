#include <litdocx/converter.hpp>
#include <litdocx/error.hpp>

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <utility>

namespace litdocx {

namespace {

auto is_blank(std::string_view text) -> bool {
    return std::ranges::all_of(text, [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    });
}

auto tag_name(Tag tag) -> std::string {
    return "<" + std::string{to_string_view(tag)} + ">";
}

[[noreturn]] void structural_error(std::string message) {
    throw ConversionError{ErrorKind::structural_error, std::move(message)};
}

// The first number of an ordered list, from its start attribute.
auto list_start(const MarkupNode& node) -> std::int64_t {
    auto it = node.attributes.find("start");
    if (it == node.attributes.end()) return 1;
    const auto& text = it->second;
    auto value = std::int64_t{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value < 0) {
        structural_error("invalid start attribute on " + tag_name(node.tag) + ": \"" +
                         text + "\"");
    }
    return value;
}

void append_run(std::vector<Run>& runs, Run run) {
    if (!run.empty()) runs.push_back(std::move(run));
}

auto make_text_run(std::string_view text, RunAttributes attrs, bool preserve) -> Run {
    return preserve ? make_preformatted_run(text, attrs) : make_run(text, attrs);
}

auto inline_attributes(Tag tag, RunAttributes attrs) -> RunAttributes {
    switch (tag) {
        case Tag::emphasis:    attrs.emphasis = true; break;
        case Tag::strong:      attrs.strong = true; break;
        case Tag::code:        attrs.code = true; break;
        case Tag::strong_code: attrs.strong = true; attrs.code = true; break;
        default:
            structural_error("unrecognized inline tag: " + tag_name(tag));
    }
    return attrs;
}

void lower_content(const MarkupNode& node, RunAttributes attrs, bool preserve,
                   std::vector<Run>& out);

void lower_inline(const MarkupNode& node, RunAttributes attrs, bool preserve,
                  std::vector<Run>& out) {
    lower_content(node, inline_attributes(node.tag, attrs), preserve, out);
}

// A node's text, then each child followed by its tail. The tail runs under
// the enclosing attributes, not the child's.
void lower_content(const MarkupNode& node, RunAttributes attrs, bool preserve,
                   std::vector<Run>& out) {
    if (!node.text.empty()) append_run(out, make_text_run(node.text, attrs, preserve));
    for (const auto& child : node.children) {
        if (!is_inline(child.tag)) {
            structural_error("unexpected block " + tag_name(child.tag) +
                             " inside inline content of " + tag_name(node.tag));
        }
        lower_inline(child, attrs, preserve, out);
        if (!child.tail.empty()) append_run(out, make_text_run(child.tail, attrs, preserve));
    }
}

// Paragraph edges carry no meaning; drop their whitespace.
void trim_edges(std::vector<Run>& runs) {
    while (!runs.empty()) {
        trim_leading_space(runs.front());
        if (!runs.front().empty()) break;
        runs.erase(runs.begin());
    }
    while (!runs.empty()) {
        trim_trailing_space(runs.back());
        if (!runs.back().empty()) break;
        runs.pop_back();
    }
}

// The numbering of the outermost list, shared by every nested item.
struct ListContext {
    NumberingPair pair;
    std::string style;
    int base_level{0};  // nesting level of the outermost list element
};

struct BlockContext {
    int level{0};
    std::optional<ListContext> list{};
};

class BlockConverter {
public:
    BlockConverter(NumberingAllocator& allocator, const StyleNames& styles,
                   std::vector<Paragraph>& out)
        : allocator_{allocator}, styles_{styles}, out_{out} {}

    void convert(const MarkupNode& node, const BlockContext& ctx) {
        if (!is_blank(node.tail)) {
            structural_error("unexpected tail text after " + tag_name(node.tag) +
                             ": \"" + node.tail + "\"");
        }

        if (auto level = heading_level(node.tag)) {
            convert_heading(node, *level);
            return;
        }

        switch (node.tag) {
            case Tag::paragraph:       convert_paragraph(node, ctx); return;
            case Tag::unordered_list:  convert_list(node, ListKind::unordered, ctx); return;
            case Tag::ordered_list:    convert_list(node, ListKind::ordered, ctx); return;
            case Tag::list_item:       convert_list_item(node, ctx); return;
            case Tag::blockquote:      convert_blockquote(node, ctx); return;
            case Tag::preformatted:    convert_preformatted(node); return;
            case Tag::horizontal_rule: convert_horizontal_rule(node); return;
            default: break;
        }
        structural_error("unrecognized block tag: " + tag_name(node.tag));
    }

private:
    auto content_paragraph(const MarkupNode& node) const -> Paragraph {
        auto paragraph = Paragraph{};
        lower_content(node, {}, false, paragraph.runs);
        trim_edges(paragraph.runs);
        return paragraph;
    }

    void convert_paragraph(const MarkupNode& node, const BlockContext& ctx) {
        auto paragraph = content_paragraph(node);
        if (ctx.list) {
            paragraph.style = ctx.list->style;
        } else if (!paragraph.runs.empty()) {
            // Decided on the lowered first run, never on the markup.
            mark_note(paragraph.runs.front());
            if (is_note_run(paragraph.runs.front())) paragraph.style = styles_.note;
        }
        out_.push_back(std::move(paragraph));
    }

    void convert_heading(const MarkupNode& node, int level) {
        auto paragraph = content_paragraph(node);
        paragraph.style = styles_.heading_prefix + std::to_string(level);
        out_.push_back(std::move(paragraph));
    }

    void convert_list(const MarkupNode& node, ListKind kind, const BlockContext& ctx) {
        if (!is_blank(node.text)) {
            structural_error("unexpected text inside " + tag_name(node.tag));
        }

        auto child_ctx = BlockContext{ctx.level + 1, ctx.list};
        if (!ctx.list) {
            const auto& style = (kind == ListKind::ordered) ? styles_.ordered_list
                                                            : styles_.bullet_list;
            auto start = (kind == ListKind::ordered) ? list_start(node) : std::int64_t{1};
            child_ctx.list = ListContext{allocator_.allocate(kind, start), style, ctx.level};
        }

        for (const auto& child : node.children) {
            if (child.tag != Tag::list_item) {
                structural_error("unexpected " + tag_name(child.tag) + " inside " +
                                 tag_name(node.tag));
            }
            convert(child, child_ctx);
        }
    }

    void convert_list_item(const MarkupNode& node, const BlockContext& ctx) {
        if (!ctx.list) structural_error("<li> outside of a list");

        auto first_block = std::ranges::find_if(node.children, [](const MarkupNode& c) {
            return !is_inline(c.tag);
        });
        if (first_block == node.children.begin() && first_block != node.children.end() &&
            is_blank(node.text)) {
            structural_error("list item without inline content before " +
                             tag_name(first_block->tag));
        }

        auto paragraph = Paragraph{};
        if (!node.text.empty()) append_run(paragraph.runs, make_run(node.text));
        for (auto it = node.children.begin(); it != first_block; ++it) {
            lower_inline(*it, {}, false, paragraph.runs);
            if (!it->tail.empty()) append_run(paragraph.runs, make_run(it->tail));
        }
        trim_edges(paragraph.runs);
        paragraph.style = ctx.list->style;
        paragraph.numbering = NumberingRef{ctx.list->pair.num_id,
                                           ctx.level - ctx.list->base_level - 1};
        out_.push_back(std::move(paragraph));

        for (auto it = first_block; it != node.children.end(); ++it) {
            if (is_inline(it->tag)) {
                structural_error("inline " + tag_name(it->tag) +
                                 " after block content inside <li>");
            }
            convert(*it, ctx);
        }
    }

    void convert_blockquote(const MarkupNode& node, const BlockContext& ctx) {
        if (ctx.level != 0) {
            structural_error("can't convert a blockquote inside a list or blockquote");
        }
        if (!is_blank(node.text)) {
            structural_error("unexpected text inside <blockquote>");
        }
        auto child_ctx = BlockContext{ctx.level + 1, std::nullopt};
        for (const auto& child : node.children) convert(child, child_ctx);
    }

    void convert_preformatted(const MarkupNode& node) {
        const auto* source = &node;
        if (node.children.size() == 1 && node.children.front().tag == Tag::code) {
            const auto& code = node.children.front();
            if (!is_blank(node.text) || !is_blank(code.tail)) {
                structural_error("unexpected text around <code> inside <pre>");
            }
            source = &code;
        }
        auto paragraph = Paragraph{};
        lower_content(*source, {}, true, paragraph.runs);
        paragraph.style = styles_.code_block;
        out_.push_back(std::move(paragraph));
    }

    void convert_horizontal_rule(const MarkupNode& node) {
        if (!is_blank(node.text) || !node.children.empty()) {
            structural_error("unexpected content inside <hr>");
        }
        auto paragraph = Paragraph{};
        paragraph.runs.push_back(make_page_break_run());
        out_.push_back(std::move(paragraph));
    }

    NumberingAllocator& allocator_;
    const StyleNames& styles_;
    std::vector<Paragraph>& out_;
};

}  // anonymous namespace

auto convert_content(const MarkupNode& node, RunAttributes attrs) -> std::vector<Run> {
    auto runs = std::vector<Run>{};
    lower_content(node, attrs, false, runs);
    return runs;
}

auto convert_inline(const MarkupNode& node, RunAttributes attrs) -> std::vector<Run> {
    auto runs = std::vector<Run>{};
    lower_inline(node, attrs, false, runs);
    return runs;
}

auto convert_block(const MarkupNode& node, NumberingAllocator& allocator,
                   const StyleNames& styles) -> std::vector<Paragraph> {
    auto paragraphs = std::vector<Paragraph>{};
    BlockConverter{allocator, styles, paragraphs}.convert(node, BlockContext{});
    return paragraphs;
}

auto convert_document(const MarkupNode& root, NumberingAllocator& allocator,
                      const StyleNames& styles) -> ConversionResult {
    if (root.tag != Tag::document) {
        structural_error("expected a document root, got " + tag_name(root.tag));
    }
    if (!is_blank(root.text)) {
        structural_error("unexpected text at document level");
    }

    auto result = ConversionResult{};
    auto converter = BlockConverter{allocator, styles, result.document.paragraphs};
    for (const auto& child : root.children) {
        converter.convert(child, BlockContext{});
    }
    result.numbering = allocator.take_pairs();
    return result;
}

}  // namespace litdocx

#include <litdocx/error.hpp>
#include <litdocx/markdown.hpp>

#include <md4c.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace litdocx {

namespace {

// Blockquotes and list items deeper than this are rejected.
constexpr int max_nesting = 32;

// Raw HTML is kept as text; tables, strikethrough and the other extensions
// stay off, so their syntax is plain prose.
constexpr unsigned parser_flags = MD_FLAG_NOHTML;

auto block_name(MD_BLOCKTYPE type) -> std::string {
    switch (type) {
        case MD_BLOCK_HTML:  return "<html>";
        case MD_BLOCK_TABLE: return "<table>";
        case MD_BLOCK_THEAD: return "<thead>";
        case MD_BLOCK_TBODY: return "<tbody>";
        case MD_BLOCK_TR:    return "<tr>";
        case MD_BLOCK_TH:    return "<th>";
        case MD_BLOCK_TD:    return "<td>";
        default:             return "block " + std::to_string(static_cast<int>(type));
    }
}

auto span_name(MD_SPANTYPE type) -> std::string {
    switch (type) {
        case MD_SPAN_A:   return "<a>";
        case MD_SPAN_IMG: return "<img>";
        case MD_SPAN_DEL: return "<del>";
        case MD_SPAN_U:   return "<u>";
        default:          return "span " + std::to_string(static_cast<int>(type));
    }
}

void append_utf8(std::string& out, std::uint32_t code_point) {
    if (code_point == 0 || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        code_point = 0xFFFD;
    }
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

// Numeric references and the XML entities; any other entity is kept as
// written.
auto decode_entity(std::string_view entity) -> std::string {
    auto result = std::string{};
    if (entity.size() > 3 && entity[1] == '#') {
        auto hex = entity[2] == 'x' || entity[2] == 'X';
        auto digits = entity.substr(hex ? 3 : 2, entity.size() - (hex ? 4 : 3));
        auto value = std::uint32_t{0};
        for (auto c : digits) {
            auto digit = (c >= '0' && c <= '9')   ? c - '0'
                         : (c >= 'a' && c <= 'f') ? c - 'a' + 10
                         : (c >= 'A' && c <= 'F') ? c - 'A' + 10
                                                  : 16;
            if (digit >= (hex ? 16 : 10)) return std::string{entity};
            value = std::min<std::uint32_t>(value * (hex ? 16 : 10) + digit, 0x110000);
        }
        append_utf8(result, value);
        return result;
    }
    if (entity == "&amp;") return "&";
    if (entity == "&lt;") return "<";
    if (entity == "&gt;") return ">";
    if (entity == "&quot;") return "\"";
    if (entity == "&apos;") return "'";
    if (entity == "&nbsp;") return "\xC2\xA0";
    return std::string{entity};
}

// Text belongs to a node's own text until it has children, then to the
// last child's tail.
void append_text(MarkupNode& node, std::string_view text) {
    if (node.children.empty()) {
        node.text += text;
    } else {
        node.children.back().tail += text;
    }
}

// A list item's first paragraph becomes the item's own inline content;
// whatever follows it stays a block child. Tight items arrive that way
// already.
void fold_first_paragraph(MarkupNode& item) {
    if (!item.text.empty() || item.children.empty() ||
        item.children.front().tag != Tag::paragraph) {
        return;
    }
    auto blocks = std::move(item.children);
    auto& first = blocks.front();
    item.text = std::move(first.text);
    item.children = std::move(first.children);
    for (auto it = blocks.begin() + 1; it != blocks.end(); ++it) {
        item.children.push_back(std::move(*it));
    }
}

// **`x`** is a single strong code span.
void collapse_strong_code(MarkupNode& strong) {
    if (!strong.text.empty() || strong.children.size() != 1) return;
    auto& code = strong.children.front();
    if (code.tag != Tag::code || !code.tail.empty() || !code.children.empty()) return;
    strong.tag = Tag::strong_code;
    strong.text = std::move(code.text);
    strong.children.clear();
}

// Builds the markup tree from md4c's callbacks. Callbacks never throw
// through the C parser: the first failure is recorded and parsing aborted.
class TreeBuilder {
public:
    TreeBuilder() : root_{make_node(Tag::document)} { stack_.push_back(&root_); }

    TreeBuilder(const TreeBuilder&) = delete;
    auto operator=(const TreeBuilder&) -> TreeBuilder& = delete;

    auto parse(std::string_view text) -> MarkupNode {
        if (text.size() > std::numeric_limits<MD_SIZE>::max()) {
            throw ConversionError{ErrorKind::markup_error, "markdown input too large"};
        }

        auto parser = MD_PARSER{};
        parser.abi_version = 0;
        parser.flags = parser_flags;
        parser.enter_block = &TreeBuilder::on_enter_block;
        parser.leave_block = &TreeBuilder::on_leave_block;
        parser.enter_span = &TreeBuilder::on_enter_span;
        parser.leave_span = &TreeBuilder::on_leave_span;
        parser.text = &TreeBuilder::on_text;

        auto status = md_parse(text.data(), static_cast<MD_SIZE>(text.size()), &parser, this);
        if (error_) throw ConversionError{std::move(*error_)};
        if (status != 0) {
            throw ConversionError{ErrorKind::markup_error,
                                  "markdown parser failed with status " + std::to_string(status)};
        }
        return std::move(root_);
    }

private:
    // -- md4c callbacks ------------------------------------------------------

    static auto on_enter_block(MD_BLOCKTYPE type, void* detail, void* self) -> int {
        return static_cast<TreeBuilder*>(self)->enter_block(type, detail);
    }
    static auto on_leave_block(MD_BLOCKTYPE type, void*, void* self) -> int {
        return static_cast<TreeBuilder*>(self)->leave_block(type);
    }
    static auto on_enter_span(MD_SPANTYPE type, void*, void* self) -> int {
        return static_cast<TreeBuilder*>(self)->enter_span(type);
    }
    static auto on_leave_span(MD_SPANTYPE type, void*, void* self) -> int {
        return static_cast<TreeBuilder*>(self)->leave_span(type);
    }
    static auto on_text(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size, void* self) -> int {
        return static_cast<TreeBuilder*>(self)->add_text(type, std::string_view{text, size});
    }

    // -- Blocks --------------------------------------------------------------

    auto enter_block(MD_BLOCKTYPE type, void* detail) -> int {
        switch (type) {
            case MD_BLOCK_DOC:
                return 0;
            case MD_BLOCK_QUOTE:
                return push_nested(Tag::blockquote);
            case MD_BLOCK_UL:
                push(Tag::unordered_list);
                return 0;
            case MD_BLOCK_OL: {
                auto& list = push(Tag::ordered_list);
                auto start = static_cast<const MD_BLOCK_OL_DETAIL*>(detail)->start;
                if (start != 1) list.attributes["start"] = std::to_string(start);
                return 0;
            }
            case MD_BLOCK_LI:
                return push_nested(Tag::list_item);
            case MD_BLOCK_HR:
                push(Tag::horizontal_rule);
                return 0;
            case MD_BLOCK_H:
                push(heading_tag(static_cast<int>(
                    static_cast<const MD_BLOCK_H_DETAIL*>(detail)->level)));
                return 0;
            case MD_BLOCK_CODE:
                push(Tag::preformatted);
                push(Tag::code);
                return 0;
            case MD_BLOCK_P:
                push(Tag::paragraph);
                return 0;
            default:
                return fail(ErrorKind::structural_error,
                            "unsupported markdown " + block_name(type));
        }
    }

    auto leave_block(MD_BLOCKTYPE type) -> int {
        switch (type) {
            case MD_BLOCK_DOC:
                return 0;
            case MD_BLOCK_CODE: {
                auto& code = *stack_.back();
                if (!code.text.empty() && code.text.back() == '\n') code.text.pop_back();
                pop();
                pop();
                return 0;
            }
            case MD_BLOCK_LI:
                fold_first_paragraph(*stack_.back());
                --depth_;
                pop();
                return 0;
            case MD_BLOCK_QUOTE:
                --depth_;
                pop();
                return 0;
            default:
                pop();
                return 0;
        }
    }

    // -- Spans ---------------------------------------------------------------

    auto enter_span(MD_SPANTYPE type) -> int {
        switch (type) {
            case MD_SPAN_EM:     push(Tag::emphasis); return 0;
            case MD_SPAN_STRONG: push(Tag::strong); return 0;
            case MD_SPAN_CODE:   push(Tag::code); return 0;
            default:
                return fail(ErrorKind::structural_error,
                            "unsupported markdown span " + span_name(type));
        }
    }

    auto leave_span(MD_SPANTYPE type) -> int {
        if (type == MD_SPAN_STRONG) collapse_strong_code(*stack_.back());
        pop();
        return 0;
    }

    // -- Text ----------------------------------------------------------------

    auto add_text(MD_TEXTTYPE type, std::string_view text) -> int {
        auto& node = *stack_.back();
        switch (type) {
            case MD_TEXT_NULLCHAR:
                append_text(node, "\xEF\xBF\xBD");
                return 0;
            case MD_TEXT_ENTITY:
                append_text(node, decode_entity(text));
                return 0;
            case MD_TEXT_BR:
                append_text(node, "\n");
                return 0;
            case MD_TEXT_SOFTBR:
                append_text(node, node.tag == Tag::code ? " " : "\n");
                return 0;
            default:
                append_text(node, text);
                return 0;
        }
    }

    // -- Tree ----------------------------------------------------------------

    auto push(Tag tag) -> MarkupNode& {
        auto& node = stack_.back()->append(make_node(tag));
        stack_.push_back(&node);
        return node;
    }

    auto push_nested(Tag tag) -> int {
        if (++depth_ > max_nesting) {
            return fail(ErrorKind::markup_error, "blocks nested too deeply");
        }
        push(tag);
        return 0;
    }

    void pop() {
        if (stack_.size() > 1) stack_.pop_back();
    }

    auto fail(ErrorKind kind, std::string message) -> int {
        if (!error_) error_ = Error{kind, std::move(message)};
        return 1;
    }

    MarkupNode root_;
    std::vector<MarkupNode*> stack_;
    int depth_{0};
    std::optional<Error> error_;
};

}  // anonymous namespace

auto parse_markdown(std::string_view text) -> MarkupNode {
    return TreeBuilder{}.parse(text);
}

}  // namespace litdocx

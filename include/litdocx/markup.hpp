/// @file markup.hpp
/// @brief The parsed markup tree: a closed vocabulary of block and inline tags.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace litdocx {

/// Every tag the converter understands.
///
/// The vocabulary is closed: a tree can only be built from these tags, and
/// textual tag names are validated by parse_tag() when the tree is built.
enum class Tag : std::uint8_t {
    document,
    paragraph,
    heading1,
    heading2,
    heading3,
    heading4,
    heading5,
    heading6,
    unordered_list,
    ordered_list,
    list_item,
    blockquote,
    preformatted,
    horizontal_rule,
    code,
    emphasis,
    strong,
    strong_code,
};

/// The HTML-style name of a tag ("p", "h2", "ul", "em", ...).
constexpr auto to_string_view(Tag tag) noexcept -> std::string_view {
    switch (tag) {
        case Tag::document:        return "body";
        case Tag::paragraph:       return "p";
        case Tag::heading1:        return "h1";
        case Tag::heading2:        return "h2";
        case Tag::heading3:        return "h3";
        case Tag::heading4:        return "h4";
        case Tag::heading5:        return "h5";
        case Tag::heading6:        return "h6";
        case Tag::unordered_list:  return "ul";
        case Tag::ordered_list:    return "ol";
        case Tag::list_item:       return "li";
        case Tag::blockquote:      return "blockquote";
        case Tag::preformatted:    return "pre";
        case Tag::horizontal_rule: return "hr";
        case Tag::code:            return "code";
        case Tag::emphasis:        return "em";
        case Tag::strong:          return "strong";
        case Tag::strong_code:     return "strong-code";
    }
    return "unknown";
}

/// Map a tag name to a Tag.
/// @throws ConversionError (structural_error) for names outside the vocabulary.
auto parse_tag(std::string_view name) -> Tag;

/// True for the inline tags: code, emphasis, strong, strong_code.
constexpr auto is_inline(Tag tag) noexcept -> bool {
    return tag == Tag::code || tag == Tag::emphasis ||
           tag == Tag::strong || tag == Tag::strong_code;
}

/// The level (1-6) of a heading tag, or nullopt for any other tag.
constexpr auto heading_level(Tag tag) noexcept -> std::optional<int> {
    switch (tag) {
        case Tag::heading1: return 1;
        case Tag::heading2: return 2;
        case Tag::heading3: return 3;
        case Tag::heading4: return 4;
        case Tag::heading5: return 5;
        case Tag::heading6: return 6;
        default:            return std::nullopt;
    }
}

/// The heading tag for a level in [1, 6].
/// @throws ConversionError (structural_error) for levels out of range.
auto heading_tag(int level) -> Tag;

/// A node of the markup tree, in the element/text/tail model.
///
/// `text` is the character data before the first child; each child's
/// `tail` is the character data that follows it inside this node. Plain
/// text therefore never appears as a node of its own.
struct MarkupNode {
    Tag tag{Tag::document};
    std::map<std::string, std::string> attributes;
    std::string text;
    std::vector<MarkupNode> children;
    std::string tail;

    /// Append a child and return a reference to it.
    auto append(MarkupNode child) -> MarkupNode& {
        children.push_back(std::move(child));
        return children.back();
    }

    auto operator==(const MarkupNode&) const -> bool = default;
};

/// Build a node.
///
/// @code
/// auto p = make_node(Tag::paragraph, "see ", {
///     make_node(Tag::emphasis, "this", {}, " note"),
/// });
/// @endcode
auto make_node(Tag tag, std::string text = {},
               std::vector<MarkupNode> children = {},
               std::string tail = {}) -> MarkupNode;

/// Build a node from a tag name, validating it against the vocabulary.
/// @throws ConversionError (structural_error) for unknown names.
auto make_node(std::string_view tag_name, std::string text = {},
               std::vector<MarkupNode> children = {},
               std::string tail = {}) -> MarkupNode;

}  // namespace litdocx

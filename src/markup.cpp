#include <litdocx/error.hpp>
#include <litdocx/markup.hpp>

#include <array>
#include <string>
#include <utility>

namespace litdocx {

namespace {

constexpr auto all_tags = std::array{
    Tag::document,       Tag::paragraph,    Tag::heading1,        Tag::heading2,
    Tag::heading3,       Tag::heading4,     Tag::heading5,        Tag::heading6,
    Tag::unordered_list, Tag::ordered_list, Tag::list_item,       Tag::blockquote,
    Tag::preformatted,   Tag::horizontal_rule, Tag::code,         Tag::emphasis,
    Tag::strong,         Tag::strong_code,
};

}  // anonymous namespace

auto parse_tag(std::string_view name) -> Tag {
    for (auto tag : all_tags) {
        if (to_string_view(tag) == name) return tag;
    }
    throw ConversionError{ErrorKind::structural_error,
                          "unrecognized tag: <" + std::string{name} + ">"};
}

auto heading_tag(int level) -> Tag {
    switch (level) {
        case 1: return Tag::heading1;
        case 2: return Tag::heading2;
        case 3: return Tag::heading3;
        case 4: return Tag::heading4;
        case 5: return Tag::heading5;
        case 6: return Tag::heading6;
        default: break;
    }
    throw ConversionError{ErrorKind::structural_error,
                          "heading level out of range: " + std::to_string(level)};
}

auto make_node(Tag tag, std::string text, std::vector<MarkupNode> children,
               std::string tail) -> MarkupNode {
    auto node = MarkupNode{};
    node.tag = tag;
    node.text = std::move(text);
    node.children = std::move(children);
    node.tail = std::move(tail);
    return node;
}

auto make_node(std::string_view tag_name, std::string text,
               std::vector<MarkupNode> children, std::string tail) -> MarkupNode {
    return make_node(parse_tag(tag_name), std::move(text), std::move(children),
                     std::move(tail));
}

}  // namespace litdocx

/// @file markdown.hpp
/// @brief Markdown parsing (md4c) into a markup tree.

#pragma once

#include <litdocx/markup.hpp>

#include <string>
#include <string_view>

namespace litdocx {

/// Extract the prose carried by annotated comment lines.
///
/// Each line is trimmed; lines starting with `marker` contribute the rest of
/// the line (minus one optional space after the marker) plus a newline.
/// Every other line is dropped.
auto extract_annotated_lines(std::string_view source, std::string_view marker = "//>")
    -> std::string;

/// Parse CommonMark into a tree rooted at Tag::document.
///
/// Blocks map to headings, paragraphs, lists and items, blockquotes,
/// horizontal rules and pre > code; spans map to em, strong and code, with
/// a strong span holding only code collapsed to strong-code. Line breaks
/// inside a paragraph are kept as "\n". A list item's first paragraph is
/// kept inline in the item; later blocks of the item become its children.
/// An ordered list not starting at 1 carries a "start" attribute. Raw HTML
/// is treated as text.
/// @throws ConversionError (structural_error) for links and images.
/// @throws ConversionError (markup_error) if blockquotes and list items nest
///         deeper than 32 levels.
auto parse_markdown(std::string_view text) -> MarkupNode;

}  // namespace litdocx

/// @file converter.hpp
/// @brief Lowering of a markup tree into the output document model.

#pragma once

#include <litdocx/document.hpp>
#include <litdocx/markup.hpp>
#include <litdocx/numbering.hpp>
#include <litdocx/options.hpp>
#include <litdocx/run.hpp>

#include <vector>

namespace litdocx {

/// The output of one conversion: the document plus every numbering pair
/// minted for it, to be registered in the numbering catalog.
struct ConversionResult {
    Document document;
    std::vector<NumberingPair> numbering;

    auto operator==(const ConversionResult&) const -> bool = default;
};

/// Lower the content of a node (its text, its inline children and their
/// tails) into runs.
///
/// Text belongs to `attrs`; each inline child adds its own attribute for its
/// subtree, and the child's tail returns to `attrs`.
/// @throws ConversionError (structural_error) on a non-inline child.
auto convert_content(const MarkupNode& node, RunAttributes attrs = {}) -> std::vector<Run>;

/// Lower one inline element (code, em, strong, strong-code) into runs.
/// The element's own tail is not included; it belongs to the parent.
/// @throws ConversionError (structural_error) if the tag is not inline.
auto convert_inline(const MarkupNode& node, RunAttributes attrs = {}) -> std::vector<Run>;

/// Lower one top-level block element into paragraphs.
///
/// Lists allocate their numbering from `allocator`.
/// @throws ConversionError (structural_error) on unknown or misplaced tags.
auto convert_block(const MarkupNode& node, NumberingAllocator& allocator,
                   const StyleNames& styles = {}) -> std::vector<Paragraph>;

/// Convert a whole tree rooted at a Tag::document node.
///
/// The allocator's recorded pairs are moved into the result.
/// @throws ConversionError (structural_error) if the root is not a document
///   or any node fails to convert. No partial document is returned.
auto convert_document(const MarkupNode& root, NumberingAllocator& allocator,
                      const StyleNames& styles = {}) -> ConversionResult;

}  // namespace litdocx

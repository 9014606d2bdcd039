/// @file document.hpp
/// @brief The output document model: paragraphs of runs.

#pragma once

#include <litdocx/run.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace litdocx {

/// Links a paragraph to a list definition in the numbering catalog.
struct NumberingRef {
    std::int64_t num_id{0};  ///< The w:numId of the list instance.
    int level{0};            ///< The indent level (w:ilvl), 0 for top-level items.

    auto operator==(const NumberingRef&) const -> bool = default;
};

/// A styled paragraph, optionally part of a numbered list.
struct Paragraph {
    std::vector<Run> runs;
    std::optional<std::string> style;       ///< Paragraph style id, if any.
    std::optional<NumberingRef> numbering;  ///< Set only for list items.

    /// Concatenated text of every run.
    auto text() const -> std::string;

    auto operator==(const Paragraph&) const -> bool = default;
};

/// The converted document: an ordered sequence of paragraphs.
struct Document {
    std::vector<Paragraph> paragraphs;

    auto size() const -> std::size_t { return paragraphs.size(); }
    auto empty() const -> bool { return paragraphs.empty(); }

    auto operator==(const Document&) const -> bool = default;
};

}  // namespace litdocx

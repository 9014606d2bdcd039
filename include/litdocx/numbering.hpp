/// @file numbering.hpp
/// @brief Allocation of list numbering definitions.

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace litdocx {

/// The two list flavours of the markup vocabulary.
enum class ListKind : std::uint8_t {
    unordered,
    ordered,
};

constexpr auto to_string_view(ListKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ListKind::unordered: return "unordered";
        case ListKind::ordered:   return "ordered";
    }
    return "unknown";
}

/// A list instance (w:num) and the definition (w:abstractNum) it uses.
struct NumberingPair {
    std::int64_t num_id{0};
    std::int64_t abstract_num_id{0};
    /// First number of an ordered list. Written as a w:startOverride when not 1.
    std::int64_t start{1};

    auto operator==(const NumberingPair&) const -> bool = default;
};

/// Mints numbering pairs for the top-level lists of one conversion.
///
/// Both counters start one past the largest identifier already present in
/// the catalog, so minted ids never collide with existing ones. Every
/// top-level list takes a fresh num_id. Unordered lists share one existing
/// abstract definition; ordered lists each get a new abstract id so their
/// numbering restarts, at 1 or at the list's start.
///
/// An allocator is scoped to a single conversion; concurrent conversions
/// each use their own instance.
class NumberingAllocator {
public:
    /// @param max_num_id Largest w:numId in the catalog (0 if none).
    /// @param max_abstract_num_id Largest w:abstractNumId in the catalog (0 if none).
    /// @param bullet_abstract_num_id The shared definition used by unordered lists.
    NumberingAllocator(std::int64_t max_num_id,
                       std::int64_t max_abstract_num_id,
                       std::int64_t bullet_abstract_num_id);

    /// Mint and record a pair for a new top-level list.
    /// @param start First number of an ordered list; ignored for unordered lists.
    auto allocate(ListKind kind, std::int64_t start = 1) -> NumberingPair;

    /// Every pair minted so far, in allocation order.
    auto pairs() const -> const std::vector<NumberingPair>& { return pairs_; }

    /// Move the recorded pairs out, leaving the allocator's record empty.
    auto take_pairs() -> std::vector<NumberingPair>;

    auto next_num_id() const -> std::int64_t { return next_num_id_; }
    auto next_abstract_num_id() const -> std::int64_t { return next_abstract_num_id_; }
    auto bullet_abstract_num_id() const -> std::int64_t { return bullet_abstract_num_id_; }

private:
    std::int64_t next_num_id_;
    std::int64_t next_abstract_num_id_;
    std::int64_t bullet_abstract_num_id_;
    std::vector<NumberingPair> pairs_;
};

}  // namespace litdocx

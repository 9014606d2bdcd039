#include <litdocx/numbering.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace litdocx;

TEST(NumberingAllocator, starts_one_past_the_catalog_maxima) {
    auto allocator = NumberingAllocator{7, 3, 1};
    EXPECT_EQ(allocator.next_num_id(), 8);
    EXPECT_EQ(allocator.next_abstract_num_id(), 4);
    EXPECT_EQ(allocator.bullet_abstract_num_id(), 1);
}

TEST(NumberingAllocator, unordered_lists_share_the_bullet_definition) {
    auto allocator = NumberingAllocator{0, 5, 2};
    auto a = allocator.allocate(ListKind::unordered);
    auto b = allocator.allocate(ListKind::unordered);

    EXPECT_EQ(a, (NumberingPair{1, 2}));
    EXPECT_EQ(b, (NumberingPair{2, 2}));
    EXPECT_EQ(allocator.next_abstract_num_id(), 6);
}

TEST(NumberingAllocator, ordered_abstract_ids_strictly_increase) {
    auto allocator = NumberingAllocator{10, 20, 1};
    auto previous = std::int64_t{20};
    for (auto i = 0; i < 5; ++i) {
        auto pair = allocator.allocate(ListKind::ordered);
        EXPECT_GT(pair.abstract_num_id, previous);
        EXPECT_NE(pair.abstract_num_id, allocator.bullet_abstract_num_id());
        previous = pair.abstract_num_id;
    }
}

TEST(NumberingAllocator, every_list_gets_a_fresh_num_id) {
    auto allocator = NumberingAllocator{0, 0, 1};
    auto a = allocator.allocate(ListKind::ordered);
    auto b = allocator.allocate(ListKind::unordered);
    auto c = allocator.allocate(ListKind::ordered);

    EXPECT_EQ(a.num_id, 1);
    EXPECT_EQ(b.num_id, 2);
    EXPECT_EQ(c.num_id, 3);
    EXPECT_EQ(a.abstract_num_id, 1);
    EXPECT_EQ(c.abstract_num_id, 2);
}

TEST(NumberingAllocator, records_pairs_in_allocation_order) {
    auto allocator = NumberingAllocator{0, 1, 1};
    auto a = allocator.allocate(ListKind::unordered);
    auto b = allocator.allocate(ListKind::ordered);

    EXPECT_EQ(allocator.pairs(), (std::vector<NumberingPair>{a, b}));

    auto taken = allocator.take_pairs();
    EXPECT_EQ(taken, (std::vector<NumberingPair>{a, b}));
    EXPECT_TRUE(allocator.pairs().empty());

    // Counters keep running after the record is taken.
    EXPECT_EQ(allocator.allocate(ListKind::unordered).num_id, 3);
}

TEST(NumberingAllocator, start_applies_to_ordered_lists_only) {
    auto allocator = NumberingAllocator{0, 0, 1};
    EXPECT_EQ(allocator.allocate(ListKind::ordered, 4), (NumberingPair{1, 1, 4}));
    EXPECT_EQ(allocator.allocate(ListKind::unordered, 4), (NumberingPair{2, 1, 1}));
}

TEST(ListKind, to_string_view) {
    EXPECT_EQ(to_string_view(ListKind::unordered), "unordered");
    EXPECT_EQ(to_string_view(ListKind::ordered), "ordered");
}

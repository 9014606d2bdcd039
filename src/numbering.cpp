#include <litdocx/numbering.hpp>

#include <utility>

namespace litdocx {

NumberingAllocator::NumberingAllocator(std::int64_t max_num_id,
                                       std::int64_t max_abstract_num_id,
                                       std::int64_t bullet_abstract_num_id)
    : next_num_id_{max_num_id + 1},
      next_abstract_num_id_{max_abstract_num_id + 1},
      bullet_abstract_num_id_{bullet_abstract_num_id} {}

auto NumberingAllocator::allocate(ListKind kind, std::int64_t start) -> NumberingPair {
    auto pair = NumberingPair{};
    pair.num_id = next_num_id_++;
    if (kind == ListKind::ordered) {
        pair.abstract_num_id = next_abstract_num_id_++;
        pair.start = start;
    } else {
        pair.abstract_num_id = bullet_abstract_num_id_;
    }
    pairs_.push_back(pair);
    return pair;
}

auto NumberingAllocator::take_pairs() -> std::vector<NumberingPair> {
    auto result = std::move(pairs_);
    pairs_.clear();
    return result;
}

}  // namespace litdocx

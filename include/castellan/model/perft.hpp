#pragma once
#include <cstdint>
#include <utility>
#include <vector>

#include "move.hpp"
#include "position.hpp"

namespace castellan::model {

// Number of leaf nodes of the legal move tree 'depth' plies deep.
[[nodiscard]] std::uint64_t perft(const Position& pos, int depth);

// Same count split by root move, in generation order.
[[nodiscard]] std::vector<std::pair<LegalMove, std::uint64_t>> perftDivide(const Position& pos,
                                                                           int depth);

}  // namespace castellan::model

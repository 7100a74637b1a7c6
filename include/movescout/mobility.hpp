#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "movescout/board.hpp"
#include "movescout/move.hpp"

namespace movescout {

// Number of pseudo-legal moves available to `side`.
std::uint64_t count_moves(const Board& b, Color side);

// Per-piece breakdown, in collector order.
void count_divide(const Board& b, Color side,
                  std::vector<std::pair<PlacedPiece, std::uint64_t>>& out);

} // namespace movescout

#pragma once
#include "movescout/board.hpp"
#include "movescout/movelist.hpp"

namespace movescout {

// Orthogonal rays: up, right, down, left ("up" is toward row 0 / rank 8).
inline constexpr Direction CROSS_DIRS[4] = {{0, -1}, {1, 0}, {0, 1}, {-1, 0}};
// Diagonal rays: up-right, down-right, down-left, up-left.
inline constexpr Direction DIAGONAL_DIRS[4] = {{1, -1}, {1, 1}, {-1, 1}, {-1, -1}};

constexpr int SLIDE_MAX = 7;

// Appends to `out` the squares reachable from `origin` along `d`, taking at
// most `max_steps` steps. Empty squares are quiet moves; the first occupied
// square ends the ray and is a capture if it holds an enemy piece.
void walk(const Board& b, const PlacedPiece& origin, Direction d, int max_steps,
          MoveList& out);

} // namespace movescout

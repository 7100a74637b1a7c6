#pragma once
#include <vector>
#include "movescout/board.hpp"
#include "movescout/move.hpp"

namespace movescout {

// Every piece of color `c`, rows 0..7 for White and 7..0 for Black,
// columns a..h within a row.
std::vector<PlacedPiece> collect_pieces(const Board& b, Color c);

} // namespace movescout

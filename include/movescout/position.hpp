#pragma once
#include <string>
#include "movescout/types.hpp"

namespace movescout {

// Algebraic name of a square: (6, 0) -> "g8", (0, 7) -> "a1".
// Throws BoundsError for coordinates off the board.
std::string square_name(int col, int row);
std::string square_name(Square s);

inline constexpr char file_char(int col) { return char('a' + col); }
inline constexpr char rank_char(int row) { return char('8' - row); }

} // namespace movescout

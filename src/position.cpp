#include "movescout/position.hpp"
#include "movescout/board.hpp"

namespace movescout {

std::string square_name(int col, int row) {
  if (!on_board(col, row))
    throw BoundsError("cannot name square (" + std::to_string(col) + ", " +
                      std::to_string(row) + ")");
  std::string s;
  s.reserve(2);
  s.push_back(file_char(col));
  s.push_back(rank_char(row));
  return s;
}

std::string square_name(Square s) {
  if (s < 0 || s >= 64)
    throw BoundsError("cannot name square index " + std::to_string(s));
  return square_name(col_of(s), row_of(s));
}

} // namespace movescout

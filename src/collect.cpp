#include "movescout/collect.hpp"

namespace movescout {

std::vector<PlacedPiece> collect_pieces(const Board& b, Color c) {
  std::vector<PlacedPiece> out;
  out.reserve(static_cast<std::size_t>(b.count(c)));

  const bool black = (c == Color::Black);
  for (int i = 0; i < BOARD_N; ++i) {
    const int row = black ? BOARD_N - 1 - i : i;
    for (int col = 0; col < BOARD_N; ++col) {
      const Cell cell = b.square_at(col, row);
      if (cell.empty() || cell.color != c) continue;
      out.push_back(PlacedPiece{ c, cell.piece, col, row });
    }
  }
  return out;
}

} // namespace movescout

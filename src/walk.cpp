#include "movescout/walk.hpp"

namespace movescout {

void walk(const Board& b, const PlacedPiece& origin, Direction d, int max_steps,
          MoveList& out) {
  int c = origin.col + d.dc, r = origin.row + d.dr;
  for (int step = 0; step < max_steps && on_board(c, r); ++step) {
    const Cell occ = b.square_at(c, r);
    if (occ.empty()) {
      out.push(Move{ c, r, Piece::None, false });
    } else {
      if (occ.color != origin.color) out.push(Move{ c, r, occ.piece, false });
      break; // blocked
    }
    c += d.dc; r += d.dr;
  }
}

} // namespace movescout

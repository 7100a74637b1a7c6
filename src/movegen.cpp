#include "movescout/movegen.hpp"
#include "movescout/position.hpp"
#include "movescout/walk.hpp"
#include <stdexcept>
#include <string>

namespace movescout {

static void walk_all(const Board& b, const PlacedPiece& p, const Direction* dirs, int n,
                     int max_steps, MoveList& out) {
  for (int i = 0; i < n; ++i) walk(b, p, dirs[i], max_steps, out);
}

void knight_moves(const Board& b, const PlacedPiece& p, MoveList& out) {
  walk_all(b, p, KNIGHT_DIRS, 8, 1, out);
}

// Rook, bishop, queen and king all reduce to rays.
void slider_moves(const Board& b, const PlacedPiece& p, MoveList& out) {
  switch (p.kind) {
    case Piece::Rook:
      walk_all(b, p, CROSS_DIRS, 4, SLIDE_MAX, out);
      break;
    case Piece::Bishop:
      walk_all(b, p, DIAGONAL_DIRS, 4, SLIDE_MAX, out);
      break;
    case Piece::Queen:
      walk_all(b, p, CROSS_DIRS, 4, SLIDE_MAX, out);
      walk_all(b, p, DIAGONAL_DIRS, 4, SLIDE_MAX, out);
      break;
    case Piece::King:
      walk_all(b, p, CROSS_DIRS, 4, 1, out);
      walk_all(b, p, DIAGONAL_DIRS, 4, 1, out);
      break;
    case Piece::Pawn:
    case Piece::Knight:
    case Piece::None:
      throw std::invalid_argument(std::string("not a ray piece: ") + piece_name(p.kind));
  }
}

void pawn_moves(const Board& b, const PlacedPiece& p, MoveList& out) {
  const int fwd = pawn_forward(p.color);
  const std::size_t first = out.size();

  // Forward: never captures, so stop at any occupant.
  const int steps = (p.row == pawn_start_row(p.color)) ? 2 : 1;
  MoveList ahead;
  walk(b, p, Direction{ 0, fwd }, steps, ahead);
  for (const auto& m : ahead) {
    if (m.is_capture()) break;
    out.push(m);
  }

  // Diagonals: captures only.
  for (int dc : {+1, -1}) {
    MoveList diag;
    walk(b, p, Direction{ dc, fwd }, 1, diag);
    for (const auto& m : diag)
      if (m.is_capture()) out.push(m);
  }

  const int promo = promotion_row(p.color);
  for (std::size_t i = first; i < out.size(); ++i)
    if (out.data[i].row == promo) out.data[i].promotion = true;
}

void generate_piece_moves(const Board& b, const PlacedPiece& p, MoveList& out) {
  const Cell here = b.square_at(p.col, p.row);
  if (here.empty() || here.piece != p.kind || here.color != p.color)
    throw std::invalid_argument("no " + std::string(color_name(p.color)) + " " +
                                piece_name(p.kind) + " on " + square_name(p.col, p.row));

  switch (p.kind) {
    case Piece::Pawn:   pawn_moves(b, p, out); break;
    case Piece::Knight: knight_moves(b, p, out); break;
    case Piece::Bishop:
    case Piece::Rook:
    case Piece::Queen:
    case Piece::King:   slider_moves(b, p, out); break;
    case Piece::None:   break; // rejected above
  }
}

} // namespace movescout

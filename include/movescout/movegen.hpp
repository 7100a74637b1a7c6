#pragma once
#include "movescout/board.hpp"
#include "movescout/movelist.hpp"


namespace movescout {


// Knight offsets, clockwise from "two up, one left".
inline constexpr Direction KNIGHT_DIRS[8] = {
  {-1, -2}, {1, -2}, {2, -1}, {2, 1}, {1, 2}, {-1, 2}, {-2, 1}, {-2, -1}};


// Pseudo-legal moves of one piece (no check, castling or en passant).
// `p` must describe what actually stands on the board at (p.col, p.row);
// std::invalid_argument otherwise.
void generate_piece_moves(const Board& b, const PlacedPiece& p, MoveList& out);

void knight_moves(const Board& b, const PlacedPiece& p, MoveList& out);
void pawn_moves(const Board& b, const PlacedPiece& p, MoveList& out);
void slider_moves(const Board& b, const PlacedPiece& p, MoveList& out);


} // namespace movescout

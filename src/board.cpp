#include "movescout/board.hpp"
#include <string>


namespace movescout {


static std::string coord_text(int col, int row) {
return "(" + std::to_string(col) + ", " + std::to_string(row) + ")";
}


Board::Board(const Grid& cells) {
for (Square s = 0; s < 64; ++s) {
const Cell& c = cells[static_cast<std::size_t>(s)];
if (c.empty()) continue;
const auto ci = static_cast<std::size_t>(c.color);
bb_[ci][static_cast<std::size_t>(c.piece)] |= (1ULL << s);
occ_[ci] |= (1ULL << s);
}
}


Cell Board::square_at(int col, int row) const {
if (!on_board(col, row))
throw BoundsError("square " + coord_text(col, row) + " is off the board");

const Square s = square_of(col, row);
for (int c = 0; c < COLOR_N; ++c) {
if (!((occ_[static_cast<std::size_t>(c)] >> s) & 1ULL)) continue;
for (int p = 0; p < PIECE_N; ++p) {
if ((bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] >> s) & 1ULL)
return Cell{ static_cast<Color>(c), static_cast<Piece>(p) };
}
}
return Cell{};
}


Cell Board::cell(Square s) const {
if (s < 0 || s >= 64)
throw BoundsError("square index " + std::to_string(s) + " is off the board");
return square_at(col_of(s), row_of(s));
}


Grid Board::grid() const {
Grid g{};
for (Square s = 0; s < 64; ++s) g[static_cast<std::size_t>(s)] = cell(s);
return g;
}


const char* piece_name(Piece p) {
switch (p) {
case Piece::Pawn:   return "Pawn";
case Piece::Knight: return "Knight";
case Piece::Bishop: return "Bishop";
case Piece::Rook:   return "Rook";
case Piece::Queen:  return "Queen";
case Piece::King:   return "King";
case Piece::None:   return "None";
}
return "None";
}


const char* color_name(Color c) {
return c == Color::White ? "white" : "black";
}


} // namespace movescout

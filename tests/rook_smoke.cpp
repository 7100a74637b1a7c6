#include <cassert>
#include "movescout/board.hpp"
#include "movescout/movegen.hpp"

int main() {
  using namespace movescout;

  // Case 1: open board rook on d4 (col 3, row 4): 7 along the rank + 7 along the file.
  {
    Grid g{};
    g[square_of(3, 4)] = Cell{ Color::White, Piece::Rook };
    Board b(g);
    MoveList ml;
    generate_piece_moves(b, PlacedPiece{ Color::White, Piece::Rook, 3, 4 }, ml);
    assert(ml.size() == 14);
    // up first: d5, d6, d7, d8
    assert((ml[0] == Move{ 3, 3, Piece::None, false }));
    assert((ml[3] == Move{ 3, 0, Piece::None, false }));
    // then right: e4
    assert((ml[4] == Move{ 4, 4, Piece::None, false }));
  }

  // Case 2: rook a8 (0,0), black pawn a3 (0,5): down ray a7..a4 quiet, a3 capture, stop.
  {
    Grid g{};
    g[square_of(0, 0)] = Cell{ Color::White, Piece::Rook };
    g[square_of(0, 5)] = Cell{ Color::Black, Piece::Pawn };
    Board b(g);
    MoveList ml;
    generate_piece_moves(b, PlacedPiece{ Color::White, Piece::Rook, 0, 0 }, ml);
    // up: none, right: b8..h8 (7), down: rows 1..5 (5), left: none
    assert(ml.size() == 12);
    for (int i = 0; i < 4; ++i) assert((ml[7 + i] == Move{ 0, 1 + i, Piece::None, false }));
    assert((ml[11] == Move{ 0, 5, Piece::Pawn, false }));
    for (const auto& m : ml) assert(!(m.col == 0 && m.row > 5));
  }

  // Case 3: own piece blocks without being captured
  {
    Grid g{};
    g[square_of(3, 4)] = Cell{ Color::White, Piece::Rook };
    g[square_of(3, 2)] = Cell{ Color::White, Piece::Knight };
    Board b(g);
    MoveList ml;
    generate_piece_moves(b, PlacedPiece{ Color::White, Piece::Rook, 3, 4 }, ml);
    // up: d5 only; right 4, down 3, left 3
    assert(ml.size() == 11);
    for (const auto& m : ml) assert(!(m.col == 3 && m.row <= 2));
  }

  return 0;
}

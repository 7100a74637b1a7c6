#include <cassert>
#include "movescout/board.hpp"
#include "movescout/walk.hpp"

int main() {
  using namespace movescout;

  Grid g{};
  g[square_of(0, 7)] = Cell{ Color::White, Piece::Rook };
  g[square_of(5, 7)] = Cell{ Color::Black, Piece::Bishop };
  g[square_of(3, 4)] = Cell{ Color::White, Piece::Pawn };
  Board b(g);
  const PlacedPiece rook{ Color::White, Piece::Rook, 0, 7 };

  // max_steps caps the ray
  {
    MoveList ml;
    walk(b, rook, Direction{ 0, -1 }, 3, ml);
    assert(ml.size() == 3);
    assert((ml[2] == Move{ 0, 4, Piece::None, false }));
  }

  // Stepping off the board right away yields nothing
  {
    MoveList ml;
    walk(b, rook, Direction{ -1, 0 }, SLIDE_MAX, ml);
    walk(b, rook, Direction{ 0, 1 }, SLIDE_MAX, ml);
    assert(ml.empty());
  }

  // Enemy ends the ray inclusively, and walk appends to what is there
  {
    MoveList ml;
    ml.push(Move{ 7, 7, Piece::None, false });
    walk(b, rook, Direction{ 1, 0 }, SLIDE_MAX, ml);
    assert(ml.size() == 1 + 5);
    assert((ml[5] == Move{ 5, 7, Piece::Bishop, false }));
  }

  // Own piece ends the ray exclusively
  {
    MoveList ml;
    walk(b, rook, Direction{ 1, -1 }, SLIDE_MAX, ml);
    assert(ml.size() == 2); // b2, c3; d4 is ours
  }

  return 0;
}

#include <cassert>
#include <set>
#include <utility>
#include "movescout/board.hpp"
#include "movescout/grid.hpp"
#include "movescout/movegen.hpp"

using namespace movescout;

static MoveList lone_knight(int col, int row) {
  Grid g{};
  g[square_of(col, row)] = Cell{ Color::White, Piece::Knight };
  MoveList ml;
  generate_piece_moves(Board(g), PlacedPiece{ Color::White, Piece::Knight, col, row }, ml);
  return ml;
}

int main() {
  // Start position, g1 knight: f3 and h3, nothing else.
  {
    Board b = parse_grid(STARTPOS_GRID);
    MoveList ml;
    generate_piece_moves(b, PlacedPiece{ Color::White, Piece::Knight, 6, 7 }, ml);
    assert(ml.size() == 2);
    assert((ml[0] == Move{ 5, 5, Piece::None, false }));
    assert((ml[1] == Move{ 7, 5, Piece::None, false }));
  }

  // All eight offsets are distinct and all reachable from d4.
  {
    MoveList ml = lone_knight(3, 4);
    assert(ml.size() == 8);
    std::set<std::pair<int, int>> seen;
    for (const auto& m : ml) seen.insert({ m.col, m.row });
    assert(seen.size() == 8);
    assert(seen.count({ 1, 5 }) == 1); // two left, one down
    assert(seen.count({ 1, 3 }) == 1); // two left, one up
  }

  // Empty-board mobility table: 2/3/4/6/8, 336 in total.
  {
    int total = 0;
    for (int r = 0; r < 8; ++r)
      for (int c = 0; c < 8; ++c) {
        const int n = static_cast<int>(lone_knight(c, r).size());
        assert(n == 2 || n == 3 || n == 4 || n == 6 || n == 8);
        total += n;
      }
    assert(total == 336);
    assert(lone_knight(0, 0).size() == 2);
    assert(lone_knight(1, 0).size() == 3);
    assert(lone_knight(2, 0).size() == 4);
    assert(lone_knight(1, 1).size() == 4);
    assert(lone_knight(2, 1).size() == 6);
  }

  // Captures enemies, skips friends.
  {
    Grid g{};
    g[square_of(3, 4)] = Cell{ Color::White, Piece::Knight };
    g[square_of(2, 2)] = Cell{ Color::Black, Piece::Bishop };
    g[square_of(4, 2)] = Cell{ Color::White, Piece::Pawn };
    MoveList ml;
    generate_piece_moves(Board(g), PlacedPiece{ Color::White, Piece::Knight, 3, 4 }, ml);
    assert(ml.size() == 7);
    assert((ml[0] == Move{ 2, 2, Piece::Bishop, false }));
  }

  return 0;
}

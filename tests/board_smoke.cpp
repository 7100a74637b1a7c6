#include <cassert>
#include "movescout/board.hpp"
#include "movescout/grid.hpp"


int main() {
using namespace movescout;


// Empty board has nothing on it
Board e;
assert(e.square_at(0, 0).empty());
assert(e.count(Color::White) == 0 && e.count(Color::Black) == 0);


Board b = parse_grid(STARTPOS_GRID);
// a8 black rook, e1 white king, d4 empty
assert((b.square_at(0, 0) == Cell{ Color::Black, Piece::Rook }));
assert((b.square_at(4, 7) == Cell{ Color::White, Piece::King }));
assert(b.square_at(3, 4).empty());
assert(b.occupied(6, 7) && !b.occupied(6, 5));
assert(b.count(Color::White) == 16 && b.count(Color::Black) == 16);
assert(b.pieces(Color::White, Piece::Pawn) == 0x00FF000000000000ULL);


// Off-board access is an error, never a default
bool threw = false;
try { (void)b.square_at(8, 0); } catch (const BoundsError&) { threw = true; }
assert(threw);
threw = false;
try { (void)b.square_at(0, -1); } catch (const BoundsError&) { threw = true; }
assert(threw);
threw = false;
try { (void)b.cell(64); } catch (const BoundsError&) { threw = true; }
assert(threw);


// grid() reproduces the input cells
Board c(b.grid());
assert(c.grid() == b.grid());


return 0;
}

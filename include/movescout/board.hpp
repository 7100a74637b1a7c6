#pragma once
#include <array>
#include <bit>
#include <cstdint>
#include <stdexcept>
#include "movescout/types.hpp"


namespace movescout {


// Thrown when a coordinate outside the 8x8 board is dereferenced.
struct BoundsError : std::out_of_range { using std::out_of_range::out_of_range; };


struct Cell {
Color color = Color::White;
Piece piece = Piece::None;

bool empty() const { return piece == Piece::None; }
bool operator==(const Cell&) const = default;
};


// 64 cells in storage order: row 0 (rank 8) first, columns a..h within a row.
using Grid = std::array<Cell, 64>;


// Read-only 8x8 position. Built once from a validated grid; there is no way
// to change it afterwards.
class Board {
public:
Board() = default; // empty board
explicit Board(const Grid& cells);


// Throws BoundsError unless col, row are both in [0,7].
Cell square_at(int col, int row) const;

// Same lookup for a 0..63 index; -1 etc. also throw.
Cell cell(Square s) const;

bool occupied(int col, int row) const { return !square_at(col, row).empty(); }

U64 pieces(Color c, Piece p) const {
  return bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)];
}
U64 occupancy(Color c) const { return occ_[static_cast<std::size_t>(c)]; }
int count(Color c) const { return std::popcount(occupancy(c)); }

Grid grid() const;


private:
// bitboards[color][piece], bit index = Square
std::array<std::array<U64, PIECE_N>, COLOR_N> bb_{};
std::array<U64, COLOR_N> occ_{};
};


} // namespace movescout

#pragma once
#include <cstdint>
#include "movescout/types.hpp"


namespace movescout {


// One candidate destination of a piece. The origin is carried by the
// PlacedPiece the move was generated for.
struct Move {
int col{0};
int row{0};
Piece captured{Piece::None}; // None = quiet move
bool promotion{false};

bool is_capture() const { return captured != Piece::None; }
Square to() const { return square_of(col, row); }
bool operator==(const Move&) const = default;
};


// A piece standing on the board, as handed to the move rules.
struct PlacedPiece {
Color color{Color::White};
Piece kind{Piece::None};
int col{0};
int row{0};

bool operator==(const PlacedPiece&) const = default;
};


struct Direction {
int dc;
int dr;
};


} // namespace movescout

#pragma once
#include <cstdint>


namespace movescout {


using U64 = std::uint64_t;
using Square = int; // 0..63, row * 8 + column (row 0 = rank 8)


enum class Color : int { White = 0, Black = 1 };


enum class Piece : int { Pawn=0, Knight=1, Bishop=2, Rook=3, Queen=4, King=5, None=6 };


constexpr int COLOR_N = 2;
constexpr int PIECE_N = 6; // without None
constexpr int BOARD_N = 8;


inline constexpr bool on_board(int col, int row) {
  return col >= 0 && col < BOARD_N && row >= 0 && row < BOARD_N;
}
inline constexpr Square square_of(int col, int row) { return row * BOARD_N + col; }
inline constexpr int col_of(Square s) { return s & 7; }
inline constexpr int row_of(Square s) { return s >> 3; }

inline constexpr Color other(Color c) { return c == Color::White ? Color::Black : Color::White; }

// Row a pawn of this color starts on, and the row it promotes on.
inline constexpr int pawn_start_row(Color c) { return c == Color::White ? 6 : 1; }
inline constexpr int promotion_row(Color c) { return c == Color::White ? 0 : 7; }
inline constexpr int pawn_forward(Color c) { return c == Color::White ? -1 : +1; }

// "Knight", "Pawn", ... ; "None" for Piece::None
const char* piece_name(Piece p);
const char* color_name(Color c);


} // namespace movescout

#pragma once
#include <iosfwd>
#include <string>
#include <string_view>
#include <stdexcept>
#include "movescout/board.hpp"

namespace movescout {

// Wrong number of rows or squares per row.
struct GridError : std::runtime_error { using std::runtime_error::runtime_error; };
// A square or color token that is not one of x, [wb][prnbqk], w, b.
struct InvalidTokenError : GridError { using GridError::GridError; };

inline constexpr char STARTPOS_GRID[] =
  "br,bn,bb,bq,bk,bb,bn,br\n"
  "bp,bp,bp,bp,bp,bp,bp,bp\n"
  "x,x,x,x,x,x,x,x\n"
  "x,x,x,x,x,x,x,x\n"
  "x,x,x,x,x,x,x,x\n"
  "x,x,x,x,x,x,x,x\n"
  "wp,wp,wp,wp,wp,wp,wp,wp\n"
  "wr,wn,wb,wq,wk,wb,wn,wr\n";

// Reads 8 non-blank lines of 8 comma-separated tokens, top row (rank 8)
// first. The stream is left positioned after the 8th row.
Board parse_grid(std::istream& in);
// As above, but trailing non-blank lines are an error.
Board parse_grid(std::string_view text);

std::string to_grid(const Board& b);

Cell parse_token(std::string_view tok);
std::string cell_token(const Cell& c); // "x" for an empty cell

// "w" or "b"
Color parse_color(std::string_view tok);

} // namespace movescout

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "movescout/board.hpp"
#include "movescout/movelist.hpp"

namespace movescout {

struct PieceMoves {
  PlacedPiece piece;
  MoveList moves;
};

struct ReportOptions {
  int threads = 1;          // >1 generates pieces on std::async tasks
};

// All pieces of `side` with their pseudo-legal moves, in collector order.
// The result does not depend on opts.threads.
std::vector<PieceMoves> generate_report(const Board& b, Color side,
                                        const ReportOptions& opts = {});

// "Knight (g1)"
std::string describe_piece(const PlacedPiece& p);

// "f3", "e5 (Capture Pawn)", "Promote on b8 (Capture Knight)"
std::string describe_move(const Move& m);

// "Knight (g1): f3, h3"
std::string format_piece_line(const PieceMoves& pm);

void write_report(std::ostream& out, const std::vector<PieceMoves>& report);

// Grid with file letters on top and rank digits down the left.
std::string labeled_board(const Board& b);

} // namespace movescout

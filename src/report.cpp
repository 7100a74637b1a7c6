#include "movescout/report.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <ostream>
#include <sstream>

#include "movescout/collect.hpp"
#include "movescout/grid.hpp"
#include "movescout/movegen.hpp"
#include "movescout/position.hpp"

namespace movescout {

static PieceMoves moves_for(const Board& b, const PlacedPiece& p) {
  PieceMoves pm{ p, {} };
  generate_piece_moves(b, p, pm.moves);
  return pm;
}

std::vector<PieceMoves> generate_report(const Board& b, Color side, const ReportOptions& opts) {
  const std::vector<PlacedPiece> pieces = collect_pieces(b, side);
  std::vector<PieceMoves> out(pieces.size());

  const std::size_t threads = static_cast<std::size_t>(std::max(1, opts.threads));

  if (threads == 1) {
    for (std::size_t i = 0; i < pieces.size(); ++i) out[i] = moves_for(b, pieces[i]);
    return out;
  }

  // Results land at the collector index, so order never depends on scheduling.
  for (std::size_t base = 0; base < pieces.size(); base += threads) {
    const std::size_t end = std::min(pieces.size(), base + threads);
    std::vector<std::future<PieceMoves>> tasks;
    tasks.reserve(end - base);
    for (std::size_t i = base; i < end; ++i)
      tasks.push_back(std::async(std::launch::async, moves_for, std::cref(b), pieces[i]));
    for (std::size_t i = base; i < end; ++i) out[i] = tasks[i - base].get();
  }
  return out;
}

std::string describe_piece(const PlacedPiece& p) {
  return std::string(piece_name(p.kind)) + " (" + square_name(p.col, p.row) + ")";
}

std::string describe_move(const Move& m) {
  std::string s = square_name(m.col, m.row);
  if (m.is_capture()) s += std::string(" (Capture ") + piece_name(m.captured) + ")";
  if (m.promotion) s = "Promote on " + s;
  return s;
}

std::string format_piece_line(const PieceMoves& pm) {
  std::string line = describe_piece(pm.piece) + ": ";
  bool first = true;
  for (const auto& m : pm.moves) {
    if (!first) line += ", ";
    line += describe_move(m);
    first = false;
  }
  return line;
}

void write_report(std::ostream& out, const std::vector<PieceMoves>& report) {
  for (const auto& pm : report) out << format_piece_line(pm) << "\n";
}

std::string labeled_board(const Board& b) {
  std::ostringstream oss;
  oss << "   a   b   c   d   e   f   g   h\n";
  for (int r = 0; r < BOARD_N; ++r) {
    oss << rank_char(r);
    for (int c = 0; c < BOARD_N; ++c) {
      const Cell cell = b.square_at(c, r);
      oss << ' ' << (cell.empty() ? std::string(" x ") : " " + cell_token(cell));
    }
    oss << '\n';
  }
  return oss.str();
}

} // namespace movescout

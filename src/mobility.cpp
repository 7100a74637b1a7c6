#include "movescout/mobility.hpp"
#include "movescout/collect.hpp"
#include "movescout/movegen.hpp"

namespace movescout {

std::uint64_t count_moves(const Board& b, Color side) {
  std::uint64_t nodes = 0ULL;
  MoveList ml;
  for (const auto& p : collect_pieces(b, side)) {
    ml.clear();
    generate_piece_moves(b, p, ml);
    nodes += ml.size();
  }
  return nodes;
}

void count_divide(const Board& b, Color side,
                  std::vector<std::pair<PlacedPiece, std::uint64_t>>& out) {
  out.clear();
  MoveList ml;
  for (const auto& p : collect_pieces(b, side)) {
    ml.clear();
    generate_piece_moves(b, p, ml);
    out.emplace_back(p, ml.size());
  }
}

} // namespace movescout

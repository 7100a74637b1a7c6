#pragma once
#include <array>
#include <cstddef>
#include <stdexcept>
#include "movescout/move.hpp"


namespace movescout {


// Moves of a single piece. A queen in the centre of an empty board has 27,
// the most any piece can reach.
struct MoveList {
static constexpr std::size_t CAP = 32;
std::array<Move, CAP> data{};
std::size_t sz = 0;


void push(const Move& m) {
  if (sz >= CAP) throw std::length_error("MoveList capacity exceeded");
  data[sz++] = m;
}
void clear() { sz = 0; }
const Move* begin() const { return data.data(); }
const Move* end() const { return data.data() + sz; }
const Move& operator[](std::size_t i) const { return data[i]; }
std::size_t size() const { return sz; }
bool empty() const { return sz == 0; }

bool operator==(const MoveList& o) const {
  if (sz != o.sz) return false;
  for (std::size_t i = 0; i < sz; ++i) if (!(data[i] == o.data[i])) return false;
  return true;
}
};


} // namespace movescout

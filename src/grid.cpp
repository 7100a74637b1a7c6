#include "movescout/grid.hpp"
#include <cctype>
#include <istream>
#include <sstream>
#include <string>
#include <vector>

namespace movescout {

static inline std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

static inline Piece char_to_piece(char c) {
  switch (c) {
    case 'p': return Piece::Pawn;
    case 'n': return Piece::Knight;
    case 'b': return Piece::Bishop;
    case 'r': return Piece::Rook;
    case 'q': return Piece::Queen;
    case 'k': return Piece::King;
    default:  return Piece::None;
  }
}

static inline char piece_to_char(Piece p) {
  const char* K = "pnbrqk";
  if (p == Piece::None) return 'x';
  return K[static_cast<int>(p)];
}

static std::vector<std::string_view> split_commas(std::string_view line) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t comma = line.find(',', start);
    if (comma == std::string_view::npos) {
      out.push_back(line.substr(start));
      break;
    }
    out.push_back(line.substr(start, comma - start));
    start = comma + 1;
  }
  return out;
}

Cell parse_token(std::string_view raw) {
  const std::string_view tok = trim(raw);
  if (tok == "x") return Cell{};

  const std::string quoted = "'" + std::string(tok) + "'";
  if (tok.size() != 2)
    throw InvalidTokenError("Invalid square token " + quoted + ": expected x or <color><piece>");
  for (char ch : tok)
    if (std::isupper(static_cast<unsigned char>(ch)))
      throw InvalidTokenError("Invalid square token " + quoted + ": uppercase letters");

  Cell c;
  if (tok[0] == 'w') c.color = Color::White;
  else if (tok[0] == 'b') c.color = Color::Black;
  else throw InvalidTokenError("Invalid color code in token " + quoted);

  c.piece = char_to_piece(tok[1]);
  if (c.piece == Piece::None) throw InvalidTokenError("Invalid piece code in token " + quoted);
  return c;
}

std::string cell_token(const Cell& c) {
  if (c.empty()) return "x";
  std::string s;
  s.push_back(c.color == Color::White ? 'w' : 'b');
  s.push_back(piece_to_char(c.piece));
  return s;
}

Color parse_color(std::string_view raw) {
  const std::string_view tok = trim(raw);
  if (tok == "w") return Color::White;
  if (tok == "b") return Color::Black;
  throw InvalidTokenError("Invalid active color '" + std::string(tok) + "': expected w or b");
}

static void parse_row(std::string_view line, int row, Grid& g) {
  const auto toks = split_commas(line);
  if (toks.size() != static_cast<std::size_t>(BOARD_N))
    throw GridError("Row " + std::to_string(row + 1) + ": expected 8 squares, got " +
                    std::to_string(toks.size()));
  for (int col = 0; col < BOARD_N; ++col)
    g[static_cast<std::size_t>(square_of(col, row))] = parse_token(toks[static_cast<std::size_t>(col)]);
}

Board parse_grid(std::istream& in) {
  Grid g{};
  int row = 0;
  std::string line;
  while (row < BOARD_N && std::getline(in, line)) {
    if (trim(line).empty()) continue;
    parse_row(line, row, g);
    ++row;
  }
  if (row != BOARD_N)
    throw GridError("Expected 8 rows, got " + std::to_string(row));
  return Board(g);
}

Board parse_grid(std::string_view text) {
  std::istringstream ss{std::string(text)};
  Board b = parse_grid(ss);

  std::string rest;
  while (std::getline(ss, rest))
    if (!trim(rest).empty()) throw GridError("Expected 8 rows, got more");
  return b;
}

std::string to_grid(const Board& b) {
  std::string out;
  for (int r = 0; r < BOARD_N; ++r) {
    for (int c = 0; c < BOARD_N; ++c) {
      if (c) out += ',';
      out += cell_token(b.square_at(c, r));
    }
    out += '\n';
  }
  return out;
}

} // namespace movescout

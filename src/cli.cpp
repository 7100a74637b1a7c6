#include "movescout/cli.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <fstream>
#include <istream>
#include <ostream>
#include <utility>

#include "movescout/board.hpp"
#include "movescout/grid.hpp"
#include "movescout/mobility.hpp"

namespace movescout {

void print_usage(std::ostream& out) {
  out <<
    "movescout CLI\n"
    "Usage:\n"
    "  movescout_cli moves [threads <N>] [noboard] [prompt] [verbose] [file <path>]\n"
    "  movescout_cli count [divide] [file <path>]\n"
    "  movescout_cli board [file <path>]\n"
    "  movescout_cli startpos\n"
    "Input is 8 rows of comma-separated squares (x, wp, bn, ...) followed by\n"
    "a line holding the side to list (w or b). If file is omitted, reads stdin.\n";
}

static int to_positive_int(const std::string& s) {
  if (s.empty() || s.size() > 4) throw CliUsageError("threads expects a positive integer, got '" + s + "'");
  for (char ch : s)
    if (!std::isdigit(static_cast<unsigned char>(ch)))
      throw CliUsageError("threads expects a positive integer, got '" + s + "'");
  const int n = std::stoi(s);
  if (n < 1) throw CliUsageError("threads expects a positive integer, got '" + s + "'");
  return n;
}

CliOptions parse_cli(const std::vector<std::string>& args) {
  if (args.empty()) throw CliUsageError("missing command");

  CliOptions opts{};
  opts.command = args[0];
  const std::string& cmd = opts.command;
  if (cmd != "moves" && cmd != "count" && cmd != "board" && cmd != "startpos")
    throw CliUsageError("unknown command '" + cmd + "'");

  for (std::size_t i = 1; i < args.size(); ++i) {
    const std::string& tok = args[i];
    const bool hasValue = (i + 1 < args.size());

    if (cmd != "startpos" && tok == "file") {
      if (!hasValue) throw CliUsageError("file expects a path");
      opts.file = args[++i];
      continue;
    }
    if (cmd == "moves") {
      if (tok == "noboard") { opts.showBoard = false; continue; }
      if (tok == "prompt")  { opts.prompt = true; continue; }
      if (tok == "verbose") { opts.verbose = true; continue; }
      if (tok == "threads") {
        if (!hasValue) throw CliUsageError("threads expects a value");
        opts.report.threads = to_positive_int(args[++i]);
        continue;
      }
    }
    if (cmd == "count" && tok == "divide") { opts.divide = true; continue; }

    throw CliUsageError("unexpected argument '" + tok + "' for " + cmd);
  }
  return opts;
}

static Color read_color(std::istream& in) {
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    return parse_color(line);
  }
  throw InvalidTokenError("Missing active color line: expected w or b");
}

static void run_command(const CliOptions& opts, std::istream& in, std::ostream& out,
                        std::ostream& err) {
  // board [file <path>]
  if (opts.command == "board") {
    Board b = parse_grid(in);
    out << labeled_board(b);
    return;
  }

  // count [divide] [file <path>]
  if (opts.command == "count") {
    Board b = parse_grid(in);
    const Color side = read_color(in);
    if (opts.divide) {
      std::vector<std::pair<PlacedPiece, std::uint64_t>> parts;
      count_divide(b, side, parts);
      std::uint64_t total = 0;
      for (auto& [p, n] : parts) {
        out << describe_piece(p) << " " << n << "\n";
        total += n;
      }
      out << "total " << total << "\n";
    } else {
      out << count_moves(b, side) << "\n";
    }
    return;
  }

  // moves [threads <N>] [noboard] [prompt] [verbose] [file <path>]
  if (opts.prompt) out << "\nPlease provide the current configuration of a chess board:\n";
  Board b = parse_grid(in);
  if (opts.prompt) out << "\nWho's turn is it? Type w or b for white or black: \n";
  const Color side = read_color(in);

  if (opts.verbose) {
    err << "info pieces " << b.count(side) << " side " << color_name(side)
        << " threads " << opts.report.threads << "\n";
  }
  const auto report = generate_report(b, side, opts.report);

  if (opts.showBoard) {
    out << "\n\n***** CURRENT BOARD *****\n\n" << labeled_board(b);
  }
  out << "\n***** AVAILABLE MOVES *****\n\n";
  write_report(out, report);
}

int run_cli(std::istream& in, std::ostream& out, std::ostream& err,
            const std::vector<std::string>& args) {
  if (args.empty()) { print_usage(out); return 0; }

  CliOptions opts;
  try {
    opts = parse_cli(args);
  } catch (const CliUsageError& e) {
    err << "error: " << e.what() << "\n";
    print_usage(err);
    return 1;
  }

  if (opts.command == "startpos") {
    out << STARTPOS_GRID << "w\n";
    return 0;
  }

  try {
    if (!opts.file.empty()) {
      std::ifstream f(opts.file);
      if (!f) {
        err << "error: cannot open " << opts.file << "\n";
        return 1;
      }
      run_command(opts, f, out, err);
    } else {
      run_command(opts, in, out, err);
    }
  } catch (const std::exception& e) {
    err << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

} // namespace movescout

#pragma once
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

#include "movescout/report.hpp"

namespace movescout {

// Bad command line: unknown command or token, missing or bad value.
struct CliUsageError : std::runtime_error { using std::runtime_error::runtime_error; };

struct CliOptions {
  std::string command;
  ReportOptions report{};
  bool showBoard = true;    // moves: print the labeled board first
  bool prompt = false;      // moves: print input prompts (interactive use)
  bool verbose = false;     // moves: "info" line on the error stream
  bool divide = false;      // count: per-piece breakdown
  std::string file;         // empty = read the input stream
};

// args excludes the program name. Throws CliUsageError.
CliOptions parse_cli(const std::vector<std::string>& args);

void print_usage(std::ostream& out);

// Runs one command: reads `in` (or opts.file), writes results to `out`,
// diagnostics to `err`. Returns the process exit status.
int run_cli(std::istream& in, std::ostream& out, std::ostream& err,
            const std::vector<std::string>& args);

} // namespace movescout

#include <iostream>
#include <string>
#include <vector>

#include "movescout/cli.hpp"

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  return movescout::run_cli(std::cin, std::cout, std::cerr, args);
}

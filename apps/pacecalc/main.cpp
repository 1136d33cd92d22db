#include <iostream>
#include <string>
#include <vector>
#include <pacecalc/cli.hpp>

using namespace pacecalc;

int main(int argc, char** argv) {
  const std::string prog = argc > 0 ? argv[0] : "pacecalc";
  std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
  return run_cli(prog, args, std::cout, std::cerr);
}

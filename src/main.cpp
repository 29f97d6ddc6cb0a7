#include "orbitcore/cli/commands.hpp"

#include <exception>
#include <iostream>

int main(int argc, char **argv) {
  try {
    return orbitcore::cli::run_cli(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}

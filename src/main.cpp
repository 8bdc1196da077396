#include "gardener/cli/commands.hpp"

#include <exception>
#include <iostream>

int main(int argc, char **argv) {
  try {
    return gardener::cli::run_cli(argc, argv);
  } catch (const std::exception &ex) {
    std::cerr << "fatal: " << ex.what() << "\n";
    return 1;
  }
}

#include "skillbench/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing and the exit-code contract live in the router.
  return skillbench::cli::Dispatch(argc, argv);
}

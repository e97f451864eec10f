#include "jsoncheck/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing, reporting and the exit-code contract live in the router.
  return jsoncheck::cli::Dispatch(argc, argv);
}

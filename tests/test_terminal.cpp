#include "terminal.hpp"
#include <cassert>
#include <cstdlib>
#include <stdexcept>

// An unknown terminal type is reported to the caller instead of ending the process.
static void run_unknown_terminal_tests() {
  setenv("TERM", "slate-no-such-terminal", 1);
  bool threw = false;
  try {
    Terminal term;
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  run_unknown_terminal_tests();
  return 0;
}

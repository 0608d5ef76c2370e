#include "cmd_registry.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  CommandRegistry reg;
  std::vector<std::string> got;
  std::string which;
  reg.register_command("w", [&](const CommandRegistry::Args& a){ which = "w"; got = a; });
  reg.register_command("set number", [&](const CommandRegistry::Args& a){ which = "set number"; got = a; });
  reg.register_command("set", [&](const CommandRegistry::Args& a){ which = "set"; got = a; });

  assert(reg.contains("w") && !reg.contains("q"));
  assert(reg.dispatch("w"));
  assert(which == "w" && got.empty());
  assert(reg.dispatch("  w   out.txt "));
  assert(which == "w" && got == std::vector<std::string>({"out.txt"}));

  assert(reg.dispatch("set number off"));
  assert(which == "set number" && got == std::vector<std::string>({"off"}));
  // falls back to the one-word name
  assert(reg.dispatch("set wrap on"));
  assert(which == "set" && got == std::vector<std::string>({"wrap", "on"}));

  assert(!reg.dispatch("q"));
  assert(!reg.dispatch(""));
  assert(!reg.dispatch("   "));
  return 0;
}

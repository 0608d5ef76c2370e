#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include "editor.hpp"
#include "terminal.hpp"

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [file]\n";
    return EXIT_FAILURE;
  }
  std::optional<std::filesystem::path> path;
  if (argc == 2) path = std::filesystem::path(argv[1]);
  int status = EXIT_SUCCESS;
  try {
    Terminal term;
    Editor ed(path);
    status = ed.run();
  } catch (const std::exception& e) {
    // the terminal is restored by now, so the message lands on a sane tty
    std::cerr << "slate: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return status;
}

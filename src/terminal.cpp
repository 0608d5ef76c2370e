#include "terminal.hpp"
#include <locale.h>
#include <ncurses.h>
#include <stdexcept>

// Escape is a key of its own in the editor; keep the wait for a sequence short.
static constexpr int kEscDelayMs = 25;

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  // newterm reports failure instead of exiting the process like initscr
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) throw std::runtime_error("cannot initialise terminal (is TERM set?)");
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(kEscDelayMs);
}

Terminal::~Terminal() {
  endwin();
  delscreen(screen_);
}

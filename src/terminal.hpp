#pragma once
/*
 * Terminal
 *
 * Purpose: owns the ncurses screen for the lifetime of the editor.
 * Usage: construct in main before the Editor; throws std::runtime_error when
 * stdout is not a usable terminal. The destructor restores the tty and frees
 * the screen.
 * Note: sets the locale so the wide-character API decodes UTF-8 input.
 */

struct screen;

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

private:
  struct screen* screen_ = nullptr;
};

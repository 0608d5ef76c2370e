#ifndef NCURSES_WIDECHAR
#define NCURSES_WIDECHAR 1
#endif
#include "ncurses_terminal.hpp"
#include <ncurses.h>
#include <cstring>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) init_pair(1, -1, -1);
    else init_pair(1, COLOR_WHITE, COLOR_BLACK); // fallback
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(1));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(1));
}

void NcursesTerminal::draw_reversed(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

KeyPress NcursesTerminal::read_key() {
  wint_t wch = 0;
  int rc = get_wch(&wch);
  if (rc == ERR) return {};
  if (rc == KEY_CODE_YES) {
    switch (wch) {
      case KEY_LEFT: return {KeyPress::Left};
      case KEY_RIGHT: return {KeyPress::Right};
      case KEY_UP: return {KeyPress::Up};
      case KEY_DOWN: return {KeyPress::Down};
      case KEY_HOME: return {KeyPress::Home};
      case KEY_END: return {KeyPress::End};
      case KEY_BACKSPACE: return {KeyPress::Backspace};
      case KEY_ENTER: return {KeyPress::Enter};
      case KEY_RESIZE: return {KeyPress::Resize};
      default: break;
    }
    // xterm-style modified arrows have no fixed KEY_ constant
    const char* name = keyname((int)wch);
    if (name && std::strcmp(name, "kLFT5") == 0) return {KeyPress::WordLeft};
    if (name && std::strcmp(name, "kRIT5") == 0) return {KeyPress::WordRight};
    return {};
  }
  char32_t c = static_cast<char32_t>(wch);
  switch (c) {
    case 27: return {KeyPress::Escape};
    case '\n': case '\r': return {KeyPress::Enter};
    case '\t': return {KeyPress::Tab, U'\t'};
    case 8: case 127: return {KeyPress::Backspace};
    default: break;
  }
  if (c >= 1 && c <= 26) return {KeyPress::Ctrl, static_cast<char32_t>(U'a' + (c - 1))};
  if (c < 32) return {};
  return {KeyPress::Char, c};
}

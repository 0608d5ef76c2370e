#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh,
 * key input).
 * Goal: decouple the editor from ncurses; keys arrive already classified.
 * Text: draw calls take UTF-8 already expanded to display cells.
 */
#include <string>

struct TermSize { int rows; int cols; };

struct KeyPress {
  enum Kind {
    None, Char, Enter, Backspace, Tab, Escape, Ctrl,
    Left, Right, Up, Down, WordLeft, WordRight, Home, End, Resize
  } kind = None;
  char32_t ch = 0; // Char: the code point; Ctrl: lowercase letter
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_reversed(int row, int col, const std::string& text) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual KeyPress read_key() = 0;
};

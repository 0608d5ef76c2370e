#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Model: a grid of cells; a double-width character fills its cell and
 * leaves the next one empty. Keys are served from a scripted queue.
 */
#include <algorithm>
#include <deque>
#include <set>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "unicode_width.hpp"
#include "utf8.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols)
      : rows_(rows), cols_(cols), grid_(rows, std::u32string(cols, U' ')) {}

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override {
    for (auto& r : grid_) r.assign(cols_, U' ');
    reversed_.clear();
  }
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text); }
  void draw_reversed(int row, int col, const std::string& text) override {
    put(row, col, text);
    reversed_.insert(row);
  }
  void move_cursor(int row, int col) override { cursor_ = {row, col}; }
  void refresh() override { ++frames_; }
  void clear_to_eol(int row, int col) override {
    if (row < 0 || row >= rows_) return;
    for (int c = std::max(0, col); c < cols_; ++c) grid_[row][c] = U' ';
  }
  KeyPress read_key() override {
    if (keys_.empty()) return {};
    KeyPress k = keys_.front();
    keys_.pop_front();
    return k;
  }

  void push_key(KeyPress k) { keys_.push_back(k); }
  // Row contents as UTF-8 without trailing blanks.
  std::string line(int row) const {
    std::u32string r;
    for (char32_t c : grid_.at(row)) if (c != 0) r.push_back(c);
    while (!r.empty() && r.back() == U' ') r.pop_back();
    return utf8_encode(r);
  }
  bool is_reversed(int row) const { return reversed_.count(row) != 0; }
  TermSize cursor() const { return cursor_; }
  int frames() const { return frames_; }

private:
  void put(int row, int col, const std::string& text) {
    if (row < 0 || row >= rows_) return;
    size_t i = 0;
    while (i < text.size() && col < cols_) {
      char32_t ch = utf8_next(text, i);
      size_t w = char_width(ch);
      if (w == 0) continue;
      grid_[row][col++] = ch;
      if (w == 2 && col < cols_) grid_[row][col++] = 0;
    }
  }

  int rows_;
  int cols_;
  std::vector<std::u32string> grid_;
  std::set<int> reversed_;
  std::deque<KeyPress> keys_;
  TermSize cursor_{0, 0};
  int frames_ = 0;
};

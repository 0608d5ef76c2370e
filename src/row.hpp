#pragma once
/*
 * Row
 *
 * Purpose: one line of text plus the prefix-sum table that maps a character
 * index to its display column (tabs expanded, wide characters counted as 2).
 * Invariant: indices().size() == len() + 1, indices()[0] == 0, non-decreasing,
 * indices()[len()] == width().
 * Note: a Row holds no configuration; operations that compute widths take
 * the tab width as an argument.
 */
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "config.hpp"
#include "types.hpp"

class Row {
public:
  Row() = default;
  explicit Row(std::string_view raw, size_t tab_width = SLATE_DEFAULT_TAB_WIDTH);
  Row(std::u32string text, size_t tab_width);

  // start is a character index; throws OutOfRange past the end of the row.
  Status insert(size_t start, std::string_view text, size_t tab_width = SLATE_DEFAULT_TAB_WIDTH);
  Status insert(size_t start, char32_t ch, size_t tab_width = SLATE_DEFAULT_TAB_WIDTH);
  // Character ranges [start, end) and [first, last].
  Status remove(size_t start, size_t end);
  Status remove_inclusive(size_t first, size_t last);

  std::pair<Row, Row> split(size_t idx) const;
  // New row holding this row followed by other.
  Row splice(const Row& other) const;

  std::vector<size_t> words() const;
  size_t next_word_forth(size_t from) const;
  size_t next_word_back(size_t from) const;

  // Text from display column `from` on, tabs expanded. A cut through a wide
  // character or a tab shows as one space.
  std::string render(size_t from) const;
  std::string render_full() const;
  std::string render_raw() const;

  // Character index at display column x; len() when x >= width().
  size_t get_char_ptr(size_t x) const;
  size_t width() const { return indices_.back(); }
  size_t len() const { return text_.size(); }
  bool is_empty() const { return text_.empty(); }

  char32_t char_at(size_t idx) const;
  // Display column where character idx starts; idx == len() gives width().
  size_t display_col(size_t idx) const;
  size_t char_width_at(size_t idx) const;

  const std::u32string& text() const { return text_; }
  const std::vector<size_t>& indices() const { return indices_; }

  bool operator==(const Row&) const = default;

  // Dirty flag for clients (e.g. highlighting caches).
  bool modified = false;

private:
  static size_t cell_width(char32_t ch, size_t tab_width);
  void append_expanded(std::string& out, size_t idx) const;

  std::u32string text_;
  std::vector<size_t> indices_{0};
};

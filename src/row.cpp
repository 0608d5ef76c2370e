#include "row.hpp"
#include <algorithm>
#include "error.hpp"
#include "unicode_width.hpp"
#include "utf8.hpp"
#include "words.hpp"

size_t Row::cell_width(char32_t ch, size_t tab_width) {
  return ch == U'\t' ? tab_width : char_width(ch);
}

Row::Row(std::string_view raw, size_t tab_width) : Row(utf8_decode(raw), tab_width) {}

Row::Row(std::u32string text, size_t tab_width) : text_(std::move(text)) {
  indices_.reserve(text_.size() + 1);
  size_t acc = 0;
  for (char32_t ch : text_) {
    acc += cell_width(ch, tab_width);
    indices_.push_back(acc);
  }
}

Status Row::insert(size_t start, std::string_view text, size_t tab_width) {
  if (start > len()) throw OutOfRange("insert at " + std::to_string(start));
  std::u32string chars = utf8_decode(text);
  if (chars.empty()) return Status::None;
  // widths of the new characters, then shift the suffix by their total
  std::vector<size_t> added;
  added.reserve(chars.size());
  size_t acc = indices_[start];
  for (char32_t ch : chars) {
    acc += cell_width(ch, tab_width);
    added.push_back(acc);
  }
  size_t span = acc - indices_[start];
  for (size_t i = start + 1; i < indices_.size(); ++i) indices_[i] += span;
  indices_.insert(indices_.begin() + static_cast<std::ptrdiff_t>(start) + 1, added.begin(), added.end());
  text_.insert(start, chars);
  modified = true;
  return Status::None;
}

Status Row::insert(size_t start, char32_t ch, size_t tab_width) {
  std::string s;
  utf8_append(s, ch);
  return insert(start, s, tab_width);
}

Status Row::remove(size_t start, size_t end) {
  if (start > len()) throw OutOfRange("remove from " + std::to_string(start));
  if (end > len() || end < start) throw OutOfRange("remove to " + std::to_string(end));
  if (start == end) return Status::None;
  size_t span = indices_[end] - indices_[start];
  indices_.erase(indices_.begin() + static_cast<std::ptrdiff_t>(start) + 1,
                 indices_.begin() + static_cast<std::ptrdiff_t>(end) + 1);
  for (size_t i = start + 1; i < indices_.size(); ++i) indices_[i] -= span;
  text_.erase(start, end - start);
  modified = true;
  return Status::None;
}

Status Row::remove_inclusive(size_t first, size_t last) {
  if (last >= len()) throw OutOfRange("remove to " + std::to_string(last));
  return remove(first, last + 1);
}

std::pair<Row, Row> Row::split(size_t idx) const {
  if (idx > len()) throw OutOfRange("split at " + std::to_string(idx));
  Row left, right;
  left.text_ = text_.substr(0, idx);
  left.indices_.assign(indices_.begin(), indices_.begin() + static_cast<std::ptrdiff_t>(idx) + 1);
  left.modified = true;
  right.text_ = text_.substr(idx);
  right.indices_.clear();
  right.indices_.reserve(right.text_.size() + 1);
  size_t base = indices_[idx];
  for (size_t i = idx; i < indices_.size(); ++i) right.indices_.push_back(indices_[i] - base);
  return {std::move(left), std::move(right)};
}

Row Row::splice(const Row& other) const {
  Row joined;
  joined.text_ = text_ + other.text_;
  joined.indices_ = indices_;
  joined.indices_.reserve(joined.text_.size() + 1);
  size_t base = width();
  for (size_t i = 1; i < other.indices_.size(); ++i) joined.indices_.push_back(other.indices_[i] + base);
  joined.modified = true;
  return joined;
}

std::vector<size_t> Row::words() const { return word_boundaries(text_); }

size_t Row::next_word_forth(size_t from) const {
  for (size_t b : words()) {
    if (b > from) return b;
  }
  return len();
}

size_t Row::next_word_back(size_t from) const {
  std::vector<size_t> bounds = words();
  for (auto it = bounds.rbegin(); it != bounds.rend(); ++it) {
    if (*it < from) return *it;
  }
  return 0;
}

void Row::append_expanded(std::string& out, size_t idx) const {
  if (text_[idx] == U'\t') out.append(char_width_at(idx), ' ');
  else utf8_append(out, text_[idx]);
}

std::string Row::render(size_t from) const {
  if (from >= width()) return std::string();
  auto it = std::lower_bound(indices_.begin(), indices_.end(), from);
  size_t idx = static_cast<size_t>(it - indices_.begin());
  std::string out;
  if (indices_[idx] != from) out += ' ';
  // zero-width marks at the cut belong to the character before it
  while (idx > 0 && idx < len() && char_width_at(idx) == 0) ++idx;
  for (size_t i = idx; i < len(); ++i) append_expanded(out, i);
  return out;
}

std::string Row::render_full() const {
  std::string out;
  out.reserve(text_.size());
  for (size_t i = 0; i < len(); ++i) append_expanded(out, i);
  return out;
}

std::string Row::render_raw() const { return utf8_encode(text_); }

size_t Row::get_char_ptr(size_t x) const {
  if (x >= width()) return len();
  auto it = std::upper_bound(indices_.begin(), indices_.end(), x);
  return static_cast<size_t>(it - indices_.begin()) - 1;
}

char32_t Row::char_at(size_t idx) const {
  if (idx >= len()) throw OutOfRange("character " + std::to_string(idx));
  return text_[idx];
}

size_t Row::display_col(size_t idx) const {
  if (idx > len()) throw OutOfRange("column of character " + std::to_string(idx));
  return indices_[idx];
}

size_t Row::char_width_at(size_t idx) const {
  if (idx >= len()) throw OutOfRange("width of character " + std::to_string(idx));
  return indices_[idx + 1] - indices_[idx];
}

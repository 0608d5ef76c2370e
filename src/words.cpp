#include "words.hpp"

static bool is_blank(char32_t c) { return c == U' ' || c == U'\t'; }

std::vector<size_t> word_boundaries(std::u32string_view text) {
  std::vector<size_t> result;
  bool indent = true;
  size_t i = 0;
  while (i < text.size()) {
    char32_t c = text[i];
    if (c == U' ') {
      ++i;
    } else if (c == U'\t') {
      if (indent) result.push_back(i);
      ++i;
    } else {
      indent = false;
      result.push_back(i);
      while (i < text.size() && !is_blank(text[i])) ++i;
    }
  }
  result.push_back(text.size());
  return result;
}

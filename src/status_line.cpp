#include "status_line.hpp"
#include "row.hpp"
#include "unicode_width.hpp"
#include "utf8.hpp"

std::optional<std::string> align_sides(const std::string& lhs, const std::string& rhs,
                                       size_t width, size_t tab_width) {
  size_t used = Row(lhs, tab_width).width() + Row(rhs, tab_width).width();
  if (used > width) return std::nullopt;
  return lhs + std::string(width - used, ' ') + rhs;
}

std::string clip_to_width(std::string_view text, size_t width) {
  size_t used = 0;
  size_t i = 0;
  while (i < text.size()) {
    size_t start = i;
    size_t w = char_width(utf8_next(text, i));
    if (used + w > width) return std::string(text.substr(0, start));
    used += w;
  }
  return std::string(text);
}

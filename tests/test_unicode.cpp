#include "unicode_width.hpp"
#include "utf8.hpp"
#include <cassert>
#include <string>

static void run_width_tests() {
  assert(char_width(U'a') == 1);
  assert(char_width(U' ') == 1);
  assert(char_width(U'好') == 2);
  assert(char_width(0x3000) == 2);
  assert(char_width(0x1F600) == 2);
  assert(char_width(0x0301) == 0);
  assert(char_width(0x200B) == 0);
  assert(char_width(0x00) == 0);
  assert(char_width(U'\t') == 0);
  assert(char_width(0x7F) == 0);
  assert(char_width(0x9F) == 0);
  assert(char_width(0xE9) == 1);
  assert(str_width("") == 0);
  assert(str_width("a好b") == 4);
  assert(str_width("e\xCC\x81") == 1);
}

static void run_utf8_tests() {
  assert(utf8_decode("a好") == std::u32string(U"a好"));
  assert(utf8_encode(U"a好\U0001F600") == "a\xE5\xA5\xBD\xF0\x9F\x98\x80");

  // invalid lead byte, then a stray continuation byte
  std::u32string bad = utf8_decode("\xFF\x80z");
  assert(bad.size() == 3);
  assert(bad[0] == kReplacementChar && bad[1] == kReplacementChar && bad[2] == U'z');

  // overlong '/' and an encoded surrogate
  assert(utf8_decode("\xC0\xAF") == std::u32string(2, kReplacementChar));
  assert(utf8_decode("\xED\xA0\x80")[0] == kReplacementChar);

  // truncated sequence at the end
  std::u32string cut = utf8_decode("a\xE5\xA5");
  assert(cut.size() == 3 && cut[0] == U'a' && cut[1] == kReplacementChar);

  size_t i = 0;
  std::string s = "好x";
  assert(utf8_next(s, i) == U'好' && i == 3);
  assert(utf8_next(s, i) == U'x' && i == 4);

  std::string out;
  utf8_append(out, 0x110000);
  assert(out == "\xEF\xBF\xBD");
}

int main() {
  run_width_tests();
  run_utf8_tests();
  return 0;
}

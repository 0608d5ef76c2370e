#include "row.hpp"
#include "error.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::vector<size_t> idx(std::initializer_list<size_t> v) { return std::vector<size_t>(v); }

static void run_construct_tests() {
  Row r("aa好b好c");
  assert(r.len() == 6);
  assert(r.width() == 8);
  assert(r.indices() == idx({0, 1, 2, 4, 5, 7, 8}));
  assert(!r.modified);

  Row empty("");
  assert(empty.is_empty());
  assert(empty.indices() == idx({0}));
  assert(empty.render_full().empty());

  Row tabs("\tab", 4);
  assert(tabs.indices() == idx({0, 4, 5, 6}));
  assert(tabs.render_full() == "    ab");
  assert(tabs.render_raw() == "\tab");
  Row wide_tabs("\tab", 8);
  assert(wide_tabs.width() == 10);
}

static void run_edit_tests() {
  Row r("aa好b好c");
  r.insert(3, "hao");
  r.insert(2, "ni");
  assert(r.render_raw() == "aani好haob好c");
  assert(r.modified);
  assert(r.indices() == Row("aani好haob好c").indices());

  r.remove(3, 7);
  assert(r.render_raw() == "aanob好c");
  assert(r.indices() == idx({0, 1, 2, 3, 4, 5, 7, 8}));
  assert(r.render(5) == "好c");
  assert(r.render(6) == " c");
  assert(r.render(7) == "c");
  assert(r.render(8).empty());

  Row t("ab");
  t.insert(1, "好\t", 4);
  assert(t.indices() == Row("a好\tb", 4).indices());
  t.insert(t.len(), U'!');
  assert(t.render_raw() == "a好\tb!");

  Row q("abcdef");
  q.remove_inclusive(1, 2);
  assert(q.render_raw() == "adef");
  q.remove(0, 0);
  assert(q.render_raw() == "adef");

  bool threw = false;
  try { q.insert(5, "x"); } catch (const OutOfRange&) { threw = true; }
  assert(threw);
  threw = false;
  try { q.remove(2, 9); } catch (const OutOfRange&) { threw = true; }
  assert(threw);
  threw = false;
  try { q.remove(3, 2); } catch (const OutOfRange&) { threw = true; }
  assert(threw);
  assert(q.render_raw() == "adef");
}

static void run_char_ptr_tests() {
  Row r("呢逆反驳船r舱s");
  assert(r.get_char_ptr(0) == 0);
  assert(r.get_char_ptr(2) == 1);
  assert(r.get_char_ptr(3) == 1);
  assert(r.get_char_ptr(4) == 2);
  assert(r.get_char_ptr(10) == 5);
  assert(r.get_char_ptr(11) == 6);
  assert(r.get_char_ptr(13) == 7);
  assert(r.get_char_ptr(14) == 8);
  assert(r.get_char_ptr(40) == 8);

  Row s("sr饿t肚子rsf萨t订");
  assert(s.get_char_ptr(0) == 0);
  assert(s.get_char_ptr(2) == 2);
  assert(s.get_char_ptr(4) == 3);
  assert(s.get_char_ptr(5) == 4);
  assert(s.get_char_ptr(7) == 5);
  assert(s.get_char_ptr(9) == 6);
  assert(s.get_char_ptr(12) == 9);
  assert(s.get_char_ptr(14) == 10);
  assert(s.get_char_ptr(15) == 11);
  assert(s.get_char_ptr(17) == 12);

  assert(s.char_at(2) == U'饿');
  assert(s.display_col(3) == 4);
  assert(s.char_width_at(2) == 2);
  assert(s.display_col(s.len()) == s.width());
  bool threw = false;
  try { s.char_at(s.len()); } catch (const OutOfRange&) { threw = true; }
  assert(threw);
}

static void run_split_splice_tests() {
  Row r("hello 好world");
  auto [left, right] = r.split(6);
  assert(left.render_raw() == "hello ");
  assert(right.render_raw() == "好world");
  assert(right.indices() == Row("好world").indices());
  assert(left.modified);

  Row joined = left.splice(right);
  assert(joined.render_raw() == r.render_raw());
  assert(joined.indices() == r.indices());

  auto [all, none] = r.split(r.len());
  assert(all.text() == r.text());
  assert(none.is_empty());
  assert(none.indices() == idx({0}));
}

static void run_zero_width_tests() {
  // e + COMBINING ACUTE ACCENT + x
  Row r("e\xCC\x81x");
  assert(r.len() == 3);
  assert(r.indices() == idx({0, 1, 1, 2}));
  assert(r.get_char_ptr(1) == 2);
  assert(r.render(1) == "x");
  r.insert(3, U'y');
  assert(r.render_raw() == "e\xCC\x81xy");
}

int main() {
  run_construct_tests();
  run_edit_tests();
  run_char_ptr_tests();
  run_split_splice_tests();
  run_zero_width_tests();
  return 0;
}

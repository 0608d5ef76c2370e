#include "document.hpp"
#include "error.hpp"
#include <cassert>
#include <initializer_list>

static Document make_doc(Size size, std::initializer_list<const char*> lines) {
  Document doc(size);
  for (const char* l : lines) doc.rows.emplace_back(l, doc.info.tab_width);
  return doc;
}

// char_ptr must always agree with the display column
static bool consistent(const Document& doc) {
  if (doc.loc().y >= doc.rows.size()) return doc.char_ptr == 0 && doc.loc().x == 0;
  return doc.char_ptr == doc.current_row().get_char_ptr(doc.loc().x);
}

static void run_line_snapping_tests() {
  Document doc = make_doc({10, 5}, {"My", "new好", "document", "好", ""});
  doc.goto_loc({5, 2});
  assert(doc.cursor.x == 5 && doc.char_ptr == 5);
  assert(doc.move_down() == Status::None);
  assert(doc.loc().y == 3);
  assert(doc.cursor.x == 2 && doc.char_ptr == 1);
  assert(consistent(doc));
  assert(doc.move_down() == Status::None);
  assert(doc.cursor.x == 0 && doc.char_ptr == 0);
  assert(doc.move_down() == Status::EndOfDocument);

  doc.goto_loc({4, 1});
  assert(doc.cursor.x == 5 && doc.char_ptr == 4);
  assert(doc.move_up() == Status::None);
  assert(doc.cursor.x == 2 && doc.char_ptr == 2);
  assert(doc.move_up() == Status::StartOfDocument);
  assert(consistent(doc));
}

static void run_grapheme_snap_tests() {
  Document doc = make_doc({10, 5}, {"ab好cd", "abcdef"});
  doc.goto_loc({3, 1});
  assert(doc.loc().x == 3);
  doc.move_up();
  assert(doc.loc().x == 2 && doc.char_ptr == 2);
  assert(consistent(doc));
}

static void run_horizontal_scroll_tests() {
  Document doc = make_doc({5, 5}, {"abcdefghij", ""});
  for (int i = 0; i < 7; ++i) assert(doc.move_right() == Status::None);
  assert(doc.cursor.x == 4 && doc.offset.x == 3 && doc.char_ptr == 7);
  for (int i = 0; i < 7; ++i) assert(doc.move_left() == Status::None);
  assert(doc.cursor.x == 0 && doc.offset.x == 0 && doc.char_ptr == 0);
  assert(doc.move_left() == Status::StartOfRow);

  doc.move_end();
  assert(doc.char_ptr == 10 && doc.loc().x == 10);
  assert(doc.move_right() == Status::EndOfRow);
  // leaving a long row for a shorter one must not leave the cursor past its end
  doc.move_down();
  assert(doc.cursor.x == 0 && doc.offset.x == 0 && doc.char_ptr == 0);
}

static void run_vertical_scroll_tests() {
  Document doc = make_doc({10, 3}, {"r0", "r1", "r2", "r3", "r4", "r5", "r6", "r7", "r8", "r9"});
  for (int i = 0; i < 5; ++i) doc.move_down();
  assert(doc.cursor.y == 2 && doc.offset.y == 3 && doc.loc().y == 5);
  for (int i = 0; i < 4; ++i) assert(doc.move_down() == Status::None);
  assert(doc.loc().y == 9);
  assert(doc.move_down() == Status::EndOfDocument);
  for (int i = 0; i < 9; ++i) assert(doc.move_up() == Status::None);
  assert(doc.cursor.y == 0 && doc.offset.y == 0);

  doc.goto_y(7);
  assert(doc.cursor.y == 0 && doc.offset.y == 7);
  doc.goto_y(8);
  assert(doc.cursor.y == 1 && doc.offset.y == 7);
  doc.goto_y(1);
  assert(doc.cursor.y == 1 && doc.offset.y == 0);
  doc.goto_y(10);
  assert(doc.loc().y == 10 && doc.char_ptr == 0);
  bool threw = false;
  try { doc.goto_y(11); } catch (const OutOfRange&) { threw = true; }
  assert(threw);
  assert(doc.loc().y == 10);
}

static void run_goto_x_tests() {
  // 8 characters, 9 columns
  Document doc = make_doc({4, 5}, {"a好bcdefg"});
  doc.goto_x(2);
  assert(doc.loc().x == 3 && doc.char_ptr == 2);
  doc.goto_x(7);
  assert(doc.cursor.x == 0 && doc.offset.x == 8 && doc.char_ptr == 7);
  // already visible: only the cursor moves
  doc.goto_x(8);
  assert(doc.cursor.x == 1 && doc.offset.x == 8 && doc.char_ptr == 8);
  bool threw = false;
  try { doc.goto_x(9); } catch (const OutOfRange&) { threw = true; }
  assert(threw);
  assert(consistent(doc));
}

static void run_resize_tests() {
  Document doc = make_doc({10, 5}, {"1", "2", "3", "4", "abcdefghij", "5"});
  doc.goto_loc({9, 4});
  assert(doc.cursor.x == 9 && doc.cursor.y == 4);
  // a shrinking viewport keeps the cursor inside it
  doc.resize({8, 3});
  assert(doc.size == (Size{8, 3}));
  assert(doc.cursor == (Loc{0, 0}) && doc.offset == (Loc{9, 4}));
  assert(doc.loc() == (Loc{9, 4}) && doc.char_ptr == 9);
  assert(consistent(doc));
  // growing does not scroll
  Loc cur = doc.cursor, off = doc.offset;
  doc.resize({20, 10});
  assert(doc.cursor == cur && doc.offset == off);
}

static void run_word_motion_tests() {
  Document doc = make_doc({40, 5}, {"hello world foo"});
  assert(doc.move_next_word() == Status::None && doc.char_ptr == 6);
  assert(doc.move_next_word() == Status::None && doc.char_ptr == 12);
  assert(doc.move_next_word() == Status::None && doc.char_ptr == 15);
  assert(doc.move_next_word() == Status::EndOfRow);
  assert(doc.move_prev_word() == Status::None && doc.char_ptr == 12);
  assert(doc.move_prev_word() == Status::None && doc.char_ptr == 6);
  assert(doc.move_prev_word() == Status::None && doc.char_ptr == 0);
  assert(doc.move_prev_word() == Status::StartOfRow);
  doc.move_end();
  assert(doc.loc().x == 15);
  doc.move_home();
  assert(doc.loc().x == 0 && doc.char_ptr == 0);
}

static void run_special_width_tests() {
  Document tabs = make_doc({20, 5}, {"\tx"});
  tabs.move_right();
  assert(tabs.loc().x == 4 && tabs.char_ptr == 1);
  tabs.move_left();
  assert(tabs.loc().x == 0 && tabs.char_ptr == 0);

  // e + COMBINING ACUTE ACCENT + x: the mark moves with its base
  Document marks = make_doc({20, 5}, {"e\xCC\x81x"});
  marks.move_right();
  assert(marks.loc().x == 1 && marks.char_ptr == 2);
  assert(consistent(marks));
  marks.move_right();
  assert(marks.loc().x == 2 && marks.char_ptr == 3);
  marks.move_left();
  assert(marks.loc().x == 1 && marks.char_ptr == 2);
  marks.move_left();
  assert(marks.loc().x == 0 && marks.char_ptr == 0);
}

static void run_empty_document_tests() {
  Document doc({10, 5});
  assert(doc.row_count() == 0);
  assert(doc.move_left() == Status::StartOfRow);
  assert(doc.move_right() == Status::EndOfRow);
  assert(doc.move_up() == Status::StartOfDocument);
  assert(doc.move_down() == Status::EndOfDocument);
  assert(doc.move_next_word() == Status::EndOfRow);
  assert(doc.move_prev_word() == Status::StartOfRow);
  doc.move_home();
  doc.move_end();
  assert(doc.loc() == (Loc{0, 0}));
  bool threw = false;
  try { doc.current_row(); } catch (const OutOfRange&) { threw = true; }
  assert(threw);
}

static void run_round_trip_tests() {
  Document doc = make_doc({6, 5}, {"ab好c\td"});
  doc.goto_x(2);
  Loc cur = doc.cursor, off = doc.offset;
  size_t ptr = doc.char_ptr;
  doc.move_right();
  doc.move_left();
  assert(doc.cursor == cur && doc.offset == off && doc.char_ptr == ptr);
}

int main() {
  run_line_snapping_tests();
  run_grapheme_snap_tests();
  run_horizontal_scroll_tests();
  run_vertical_scroll_tests();
  run_goto_x_tests();
  run_resize_tests();
  run_word_motion_tests();
  run_special_width_tests();
  run_empty_document_tests();
  run_round_trip_tests();
  return 0;
}

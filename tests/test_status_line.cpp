#include "status_line.hpp"
#include "document.hpp"
#include "filetype.hpp"
#include <cassert>

static void run_align_tests() {
  auto s = align_sides("ab", "cd", 8, 4);
  assert(s && *s == "ab    cd");
  assert(align_sides("好", "x", 3, 4) == std::optional<std::string>("好x"));
  assert(!align_sides("hello", "world", 9, 4));
  auto t = align_sides("\t", "", 6, 4);
  assert(t && *t == "\t  ");

  assert(clip_to_width("abcdef", 3) == "abc");
  assert(clip_to_width("a好b", 2) == "a");
  assert(clip_to_width("a好b", 3) == "a好");
  assert(clip_to_width("ab", 10) == "ab");
}

static void run_filetype_tests() {
  assert(filetype_for_extension("rs") == "Rust");
  assert(filetype_for_extension("CPP") == "C++");
  assert(filetype_for_extension("md") == "Markdown");
  assert(filetype_for_extension("zzz") == "Unknown");
  assert(filetype_for_extension("") == "Unknown");
}

static void run_info_tests() {
  Document doc({20, 5});
  auto info = doc.status_line_info();
  assert(info["file"] == "[No Name]");
  assert(info["type"] == "Unknown");
  assert(info["modified"].empty());
  assert(info["row"] == "1" && info["total"] == "0" && info["column"] == "0");

  for (int i = 0; i < 12; ++i) doc.rows.emplace_back("line 好", doc.info.tab_width);
  doc.info.file = std::filesystem::path("/tmp/project/main.rs");
  doc.modified = true;
  doc.goto_loc({6, 10});
  info = doc.status_line_info();
  assert(info["file"] == "main.rs");
  assert(info["full_path"] == "/tmp/project/main.rs");
  assert(info["extension"] == "rs");
  assert(info["type"] == "Rust");
  assert(info["modified"] == "[+]");
  assert(info["row"] == "11" && info["total"] == "12");
  assert(info["column"] == "7");

  assert(doc.line_number(0) == " 1");
  assert(doc.line_number(11) == "12");
}

int main() {
  run_align_tests();
  run_filetype_tests();
  run_info_tests();
  return 0;
}

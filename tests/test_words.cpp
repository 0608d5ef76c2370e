#include "words.hpp"
#include "row.hpp"
#include <cassert>
#include <vector>

using V = std::vector<size_t>;

static void run_boundary_tests() {
  assert(word_boundaries(U"") == V({0}));
  assert(word_boundaries(U"hello") == V({0, 5}));
  assert(word_boundaries(U"hello world  foo") == V({0, 6, 13, 16}));
  assert(word_boundaries(U"  x") == V({2, 3}));
  assert(word_boundaries(U"\tHello") == V({0, 1, 6}));
  assert(word_boundaries(U"\t\tif x") == V({0, 1, 2, 5, 6}));
  // a tab after text is plain whitespace
  assert(word_boundaries(U"a\tb") == V({0, 2, 3}));
  assert(word_boundaries(U"好 世界") == V({0, 2, 4}));
  assert(Row("\tHello").words() == V({0, 1, 6}));
}

static void run_jump_tests() {
  Row r("hello world foo");
  assert(r.next_word_forth(0) == 6);
  assert(r.next_word_forth(3) == 6);
  assert(r.next_word_forth(6) == 12);
  assert(r.next_word_forth(12) == 15);
  assert(r.next_word_forth(15) == 15);
  assert(r.next_word_back(15) == 12);
  assert(r.next_word_back(13) == 12);
  assert(r.next_word_back(12) == 6);
  assert(r.next_word_back(6) == 0);
  assert(r.next_word_back(0) == 0);

  Row blank("   ");
  assert(blank.next_word_forth(0) == 3);
  assert(blank.next_word_back(3) == 0);
}

int main() {
  run_boundary_tests();
  run_jump_tests();
  return 0;
}

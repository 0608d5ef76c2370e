#include "viewport.hpp"
#include <cassert>

static void run_view_tests() {
  Axis a{0, 5};
  assert(!in_view(a, 4, 10));
  assert(in_view(a, 5, 10));
  assert(in_view(a, 14, 10));
  assert(!in_view(a, 15, 10));
  assert(a.raw() == 5);
}

static void run_jump_tests() {
  // inside the first page: no scroll
  assert(jump_axis(Axis{3, 20}, 7, 10) == (Axis{7, 0}));
  // already visible: cursor moves only
  assert(jump_axis(Axis{0, 20}, 25, 10) == (Axis{5, 20}));
  // off screen: target becomes the first visible position
  assert(jump_axis(Axis{0, 20}, 30, 10) == (Axis{0, 30}));
  assert(jump_axis(Axis{4, 20}, 12, 10) == (Axis{0, 12}));
}

static void run_step_tests() {
  Axis a{};
  a = step_forward(a, 3, 5);
  assert(a == (Axis{3, 0}));
  a = step_forward(a, 3, 5);
  assert(a == (Axis{4, 2}));
  a = step_back(a, 5);
  assert(a == (Axis{0, 1}));
  a = step_back(a, 4);
  assert(a == (Axis{0, 0}));
  // wide characters step by their width
  a = step_forward(Axis{3, 0}, 2, 5);
  assert(a == (Axis{4, 1}));
}

int main() {
  run_view_tests();
  run_jump_tests();
  run_step_tests();
  return 0;
}

#include "viewport.hpp"

bool in_view(const Axis& a, size_t pos, size_t extent) {
  return pos >= a.offset && pos < a.offset + extent;
}

Axis jump_axis(Axis a, size_t pos, size_t extent) {
  if (pos < extent) {
    a.offset = 0;
    a.cursor = pos;
  } else if (in_view(a, pos, extent)) {
    a.cursor = pos - a.offset;
  } else {
    a.cursor = 0;
    a.offset = pos;
  }
  return a;
}

Axis step_forward(Axis a, size_t n, size_t extent) {
  size_t last = extent == 0 ? 0 : extent - 1;
  while (n--) {
    if (a.cursor >= last) a.offset++;
    else a.cursor++;
  }
  return a;
}

Axis step_back(Axis a, size_t n) {
  while (n--) {
    if (a.cursor == 0) {
      if (a.offset == 0) break;
      a.offset--;
    } else {
      a.cursor--;
    }
  }
  return a;
}

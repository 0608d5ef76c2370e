#pragma once
/*
 * Viewport
 *
 * Purpose: scrolling rules for one axis as pure functions of
 * (state, request, extent) -> state, so Document only applies results.
 * Rule: a position p is in view when offset <= p < offset + extent.
 */
#include <cstddef>

struct Axis {
  size_t cursor = 0; // position inside the viewport
  size_t offset = 0; // scroll offset
  size_t raw() const { return cursor + offset; }
  bool operator==(const Axis&) const = default;
};

bool in_view(const Axis& a, size_t pos, size_t extent);

// Place pos on screen. Near the origin the offset resets to 0; inside the
// current view only the cursor moves; otherwise pos is anchored at the
// viewport start.
Axis jump_axis(Axis a, size_t pos, size_t extent);

// Move n units forward, scrolling when the cursor is pinned at the far edge.
Axis step_forward(Axis a, size_t n, size_t extent);

// Move n units back, scrolling when the cursor is pinned at 0.
// n must not exceed a.raw().
Axis step_back(Axis a, size_t n);

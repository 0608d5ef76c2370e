#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Loc/Size/Status/Mode).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

// x is a column (character index or display column, depending on the call),
// y is a row index.
struct Loc {
  size_t x = 0;
  size_t y = 0;
  bool operator==(const Loc&) const = default;
};

struct Size {
  size_t w = 0;
  size_t h = 0;
  bool operator==(const Size&) const = default;
};

// Advisory result of a movement or edit; not an error.
enum class Status { None, StartOfRow, EndOfRow, StartOfDocument, EndOfDocument };

const char* status_name(Status s);

enum class Mode { Insert, Command };

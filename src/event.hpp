#pragma once
/*
 * Event
 *
 * Purpose: atomic document edits, executed by Document::execute and
 * journalled by EditStack.
 * Payloads exist only so an event can be inverted for undo: Remove carries
 * the removed character, RemoveRow the removed text, and SpliceUp.loc.x the
 * column where the two rows join.
 */
#include <string>
#include <utility>
#include "types.hpp"

struct Event {
  enum Type { Insert, Remove, InsertRow, RemoveRow, SplitDown, SpliceUp } type = Insert;
  Loc loc;          // InsertRow/RemoveRow: loc.y is the row index
  char32_t ch = 0;  // Insert/Remove
  std::string text; // InsertRow/RemoveRow, UTF-8

  static Event insert(Loc loc, char32_t ch) { return {Insert, loc, ch, {}}; }
  static Event remove(Loc loc, char32_t ch) { return {Remove, loc, ch, {}}; }
  static Event insert_row(size_t row, std::string text) { return {InsertRow, {0, row}, 0, std::move(text)}; }
  static Event remove_row(size_t row, std::string text) { return {RemoveRow, {0, row}, 0, std::move(text)}; }
  static Event split_down(Loc loc) { return {SplitDown, loc, 0, {}}; }
  static Event splice_up(Loc loc) { return {SpliceUp, loc, 0, {}}; }

  bool operator==(const Event&) const = default;
};

// Insert <-> Remove, InsertRow <-> RemoveRow, SplitDown <-> SpliceUp.
Event inverse(const Event& e);
const char* event_name(Event::Type t);

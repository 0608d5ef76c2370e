#pragma once
/*
 * Document
 *
 * Purpose: ordered rows plus cursor/viewport state; the single entry point
 * (execute) for edits, and file open/save.
 * Coordinates: cursor is the position inside the viewport, offset the
 * scroll position; loc() = cursor + offset in display columns/rows.
 * char_ptr is the character index of the cursor in the current row and is
 * kept equal to current_row().get_char_ptr(loc().x).
 * The row one past the end (loc().y == rows.size()) is addressable as an
 * empty row so clients can append.
 */
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "event.hpp"
#include "row.hpp"
#include "types.hpp"
#include "viewport.hpp"

struct FileInfo {
  std::optional<std::filesystem::path> file;
  bool is_dos = false; // "\r\n" line endings
  // Set right after constructing the Document, before rows exist.
  size_t tab_width = SLATE_DEFAULT_TAB_WIDTH;
};

class Document {
public:
  explicit Document(Size size);

  // Replace contents with the file at path and reset cursor, offset and
  // modified. Throws FileError.
  void open(const std::filesystem::path& path);
  // Throws NoFileName without a path, FileError on write failure.
  void save();
  // Write elsewhere; the associated path and modified flag are untouched.
  void save_as(const std::filesystem::path& path) const;
  // Checked setter for info.tab_width; rebuilds every row's index table.
  void set_tab_width(size_t width);
  // New viewport extent; a cursor left outside it is re-anchored on the
  // same absolute position.
  void resize(Size s);

  Status execute(const Event& e);

  // loc.x is a character index, loc.y a row index.
  void goto_loc(Loc loc);
  void goto_x(size_t x);
  void goto_y(size_t y);

  Status move_left();
  Status move_right();
  Status move_up();
  Status move_down();
  Status move_next_word();
  Status move_prev_word();
  void move_home();
  void move_end();

  // Rows joined by the detected line ending, with a trailing line ending.
  std::string render() const;

  const Row& row(size_t idx) const;
  Row& row_mut(size_t idx);
  const Row& current_row() const;
  size_t row_count() const { return rows.size(); }
  Loc loc() const { return {cursor.x + offset.x, cursor.y + offset.y}; }

  std::string line_number(size_t idx) const;
  // Keys: row, total, column, file, full_path, type, modified, extension.
  std::map<std::string, std::string> status_line_info() const;

  FileInfo info;
  std::vector<Row> rows;
  bool modified = false;
  Size size;
  size_t char_ptr = 0;
  Loc cursor;
  Loc offset;

private:
  Axis x_axis() const { return {cursor.x, offset.x}; }
  Axis y_axis() const { return {cursor.y, offset.y}; }
  void set_x_axis(Axis a) { cursor.x = a.cursor; offset.x = a.offset; }
  void set_y_axis(Axis a) { cursor.y = a.cursor; offset.y = a.offset; }
  size_t current_len() const;
  // Clamp/snap the horizontal position onto the current row after a
  // vertical move and recompute char_ptr.
  void settle_row();
  void snap_grapheme();
};

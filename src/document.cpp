#include "document.hpp"
#include <algorithm>
#include "debug_log.hpp"
#include "error.hpp"
#include "file_io.hpp"
#include "filetype.hpp"

Document::Document(Size size) : size(size) {}

void Document::open(const std::filesystem::path& path) {
  std::string raw;
  try {
    raw = read_file(path);
  } catch (const FileError& e) {
    debug_log() << "open failed: " << e.what() << '\n';
    throw;
  }
  info.file = path;
  info.is_dos = has_crlf(raw);
  rows.clear();
  for (const auto& line : split_lines(raw)) rows.emplace_back(line, info.tab_width);
  modified = false;
  char_ptr = 0;
  cursor = {};
  offset = {};
  debug_log() << "open " << path.string() << " rows=" << rows.size()
              << (info.is_dos ? " dos" : "") << '\n';
}

void Document::save() {
  if (!info.file) throw NoFileName();
  try {
    write_file(*info.file, render());
  } catch (const FileError& e) {
    debug_log() << "save failed: " << e.what() << '\n';
    throw;
  }
  modified = false;
  for (auto& r : rows) r.modified = false;
  debug_log() << "save " << info.file->string() << '\n';
}

void Document::save_as(const std::filesystem::path& path) const {
  try {
    write_file(path, render());
  } catch (const FileError& e) {
    debug_log() << "save_as failed: " << e.what() << '\n';
    throw;
  }
  debug_log() << "save_as " << path.string() << '\n';
}

void Document::set_tab_width(size_t width) {
  if (width == 0) throw OutOfRange("tab width 0");
  info.tab_width = width;
  for (auto& r : rows) {
    bool was_modified = r.modified;
    r = Row(r.text(), width);
    r.modified = was_modified;
  }
  if (loc().y < rows.size()) {
    set_x_axis(jump_axis(x_axis(), rows[loc().y].display_col(char_ptr), size.w));
  }
}

void Document::resize(Size s) {
  size = s;
  if (size.w > 0 && cursor.x >= size.w) set_x_axis(jump_axis(x_axis(), loc().x, size.w));
  if (size.h > 0 && cursor.y >= size.h) set_y_axis(jump_axis(y_axis(), loc().y, size.h));
}

Status Document::execute(const Event& e) {
  if (debug_log_enabled()) {
    debug_log() << "execute " << event_name(e.type) << " (" << e.loc.x << ',' << e.loc.y << ")\n";
  }
  switch (e.type) {
  case Event::Insert: {
    goto_loc(e.loc);
    row_mut(e.loc.y).insert(e.loc.x, e.ch, info.tab_width);
    modified = true;
    return move_right();
  }
  case Event::Remove: {
    if (e.loc.x == 0) return Status::StartOfRow;
    goto_loc(e.loc);
    Row& r = row_mut(e.loc.y);
    size_t w = r.char_width_at(e.loc.x - 1);
    r.remove(e.loc.x - 1, e.loc.x);
    modified = true;
    set_x_axis(step_back(x_axis(), w));
    char_ptr = e.loc.x - 1;
    return Status::None;
  }
  case Event::InsertRow: {
    size_t idx = e.loc.y;
    if (idx > rows.size()) throw OutOfRange("insert row " + std::to_string(idx));
    Row r(e.text, info.tab_width);
    r.modified = true;
    rows.insert(rows.begin() + static_cast<std::ptrdiff_t>(idx), std::move(r));
    modified = true;
    goto_y(idx);
    return Status::None;
  }
  case Event::RemoveRow: {
    size_t idx = e.loc.y;
    if (idx >= rows.size()) throw OutOfRange("remove row " + std::to_string(idx));
    rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(idx));
    modified = true;
    goto_y(idx == 0 ? 0 : idx - 1);
    return Status::None;
  }
  case Event::SplitDown: {
    size_t y = e.loc.y;
    if (y >= rows.size()) throw OutOfRange("split row " + std::to_string(y));
    if (e.loc.x > rows[y].len()) throw OutOfRange("split at " + std::to_string(e.loc.x));
    auto [left, right] = rows[y].split(e.loc.x);
    rows[y] = std::move(left);
    rows.insert(rows.begin() + static_cast<std::ptrdiff_t>(y + 1), std::move(right));
    modified = true;
    goto_loc({0, y + 1});
    return Status::None;
  }
  case Event::SpliceUp: {
    size_t y = e.loc.y;
    if (y == 0) return Status::StartOfDocument;
    if (y >= rows.size()) throw OutOfRange("splice row " + std::to_string(y));
    size_t upper_len = rows[y - 1].len();
    rows[y - 1] = rows[y - 1].splice(rows[y]);
    rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(y));
    modified = true;
    goto_loc({upper_len, y - 1});
    return Status::None;
  }
  }
  return Status::None;
}

void Document::goto_loc(Loc loc) {
  goto_y(loc.y);
  goto_x(loc.x);
}

void Document::goto_x(size_t x) {
  if (x == char_ptr) return;
  if (x > current_len()) throw OutOfRange("column " + std::to_string(x));
  set_x_axis(jump_axis(x_axis(), current_row().display_col(x), size.w));
  char_ptr = x;
}

void Document::goto_y(size_t y) {
  if (y > rows.size()) throw OutOfRange("row " + std::to_string(y));
  if (y != loc().y) set_y_axis(jump_axis(y_axis(), y, size.h));
  settle_row();
}

Status Document::move_left() {
  if (char_ptr == 0) return Status::StartOfRow;
  const Row& r = current_row();
  size_t w = 0;
  // Step over trailing zero-width marks together with their base character.
  while (char_ptr > 0) {
    size_t cw = r.char_width_at(char_ptr - 1);
    --char_ptr;
    w += cw;
    if (cw != 0) break;
  }
  set_x_axis(step_back(x_axis(), w));
  return Status::None;
}

Status Document::move_right() {
  if (char_ptr >= current_len()) return Status::EndOfRow;
  const Row& r = current_row();
  size_t w = r.char_width_at(char_ptr++);
  while (char_ptr < r.len() && r.char_width_at(char_ptr) == 0) ++char_ptr;
  set_x_axis(step_forward(x_axis(), w, size.w));
  return Status::None;
}

Status Document::move_up() {
  if (loc().y == 0) return Status::StartOfDocument;
  set_y_axis(step_back(y_axis(), 1));
  settle_row();
  return Status::None;
}

Status Document::move_down() {
  if (loc().y + 1 >= rows.size()) return Status::EndOfDocument;
  set_y_axis(step_forward(y_axis(), 1, size.h));
  settle_row();
  return Status::None;
}

Status Document::move_next_word() {
  if (char_ptr >= current_len()) return Status::EndOfRow;
  goto_x(current_row().next_word_forth(char_ptr));
  return Status::None;
}

Status Document::move_prev_word() {
  if (char_ptr == 0) return Status::StartOfRow;
  goto_x(current_row().next_word_back(char_ptr));
  return Status::None;
}

void Document::move_home() { goto_x(0); }

void Document::move_end() { goto_x(current_len()); }

std::string Document::render() const {
  const char* ending = info.is_dos ? "\r\n" : "\n";
  std::string out;
  for (const auto& r : rows) {
    out += r.render_raw();
    out += ending;
  }
  return out;
}

const Row& Document::row(size_t idx) const {
  if (idx >= rows.size()) throw OutOfRange("row " + std::to_string(idx));
  return rows[idx];
}

Row& Document::row_mut(size_t idx) {
  if (idx >= rows.size()) throw OutOfRange("row " + std::to_string(idx));
  rows[idx].modified = true;
  return rows[idx];
}

const Row& Document::current_row() const { return row(loc().y); }

std::string Document::line_number(size_t idx) const {
  size_t digits = std::to_string(std::max<size_t>(rows.size(), 1)).size();
  std::string n = std::to_string(idx + 1);
  if (n.size() < digits) n.insert(0, digits - n.size(), ' ');
  return n;
}

std::map<std::string, std::string> Document::status_line_info() const {
  std::map<std::string, std::string> m;
  m["row"] = std::to_string(loc().y + 1);
  m["total"] = std::to_string(rows.size());
  m["column"] = std::to_string(loc().x);
  m["modified"] = modified ? "[+]" : "";
  if (info.file) {
    std::string ext = info.file->extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    m["file"] = info.file->filename().string();
    m["full_path"] = info.file->string();
    m["extension"] = ext;
    m["type"] = filetype_for_extension(ext);
  } else {
    m["file"] = "[No Name]";
    m["full_path"] = "[No Name]";
    m["extension"] = "";
    m["type"] = "Unknown";
  }
  return m;
}

size_t Document::current_len() const {
  return loc().y < rows.size() ? rows[loc().y].len() : 0;
}

void Document::settle_row() {
  if (loc().y >= rows.size()) {
    set_x_axis({});
    char_ptr = 0;
    return;
  }
  const Row& r = rows[loc().y];
  if (loc().x > r.width()) set_x_axis(jump_axis(x_axis(), r.width(), size.w));
  snap_grapheme();
  char_ptr = r.get_char_ptr(loc().x);
}

// A column inside a double-width or tab cell moves back to the cell start.
void Document::snap_grapheme() {
  const auto& idx = rows[loc().y].indices();
  size_t start = loc().x;
  size_t col = start;
  while (col > 0 && !std::binary_search(idx.begin(), idx.end(), col)) --col;
  if (col != start) set_x_axis(step_back(x_axis(), start - col));
}

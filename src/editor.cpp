#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include "debug_log.hpp"
#include "error.hpp"
#include "file_io.hpp"
#include "utf8.hpp"

Editor::Editor(const std::optional<std::filesystem::path>& file) {
  register_commands();
  load_rc();
  if (file) {
    try {
      doc.open(*file);
    } catch (const FileError& e) {
      // A missing file starts as a new document bound to that path.
      if (e.code() != std::errc::no_such_file_or_directory) message = e.what();
      doc.info.file = *file;
    }
  }
  resize();
}

int Editor::run() {
  while (!should_quit) {
    render();
    handle_input(term.read_key());
  }
  return exit_status;
}

void Editor::render() {
  RenderOptions opt;
  opt.show_line_numbers = show_line_numbers;
  opt.mode = mode;
  opt.message = message;
  opt.cmdline = cmdline;
  renderer.render(term, doc, opt);
}

// Text area excludes the gutter and the two bottom lines.
void Editor::resize() {
  TermSize sz = term.get_size();
  int gutter = Renderer::gutter_width(doc, show_line_numbers);
  doc.resize({static_cast<size_t>(std::max(1, sz.cols - gutter)),
              static_cast<size_t>(std::max(1, sz.rows - 2))});
}

void Editor::handle_input(const KeyPress& k) {
  if (k.kind == KeyPress::None) return;
  if (k.kind == KeyPress::Resize) { resize(); return; }
  try {
    if (mode == Mode::Command) handle_command_input(k);
    else handle_insert_input(k);
  } catch (const BufferError& e) {
    message = e.what();
    debug_log() << "error: " << e.what() << '\n';
  }
  // gutter grows with the row count
  resize();
}

void Editor::handle_insert_input(const KeyPress& k) {
  bool is_quit = k.kind == KeyPress::Ctrl && k.ch == U'q';
  if (!is_quit) quit_warned = false;
  switch (k.kind) {
    case KeyPress::Char: case KeyPress::Tab: type_char(k.ch); break;
    case KeyPress::Enter: enter(); break;
    case KeyPress::Backspace: backspace(); break;
    case KeyPress::Left: if (doc.move_left() == Status::StartOfRow) wrap_left(); break;
    case KeyPress::Right: if (doc.move_right() == Status::EndOfRow) wrap_right(); break;
    case KeyPress::Up: doc.move_up(); break;
    case KeyPress::Down: doc.move_down(); break;
    case KeyPress::WordLeft: if (doc.move_prev_word() == Status::StartOfRow) wrap_left(); break;
    case KeyPress::WordRight: if (doc.move_next_word() == Status::EndOfRow) wrap_right(); break;
    case KeyPress::Home: doc.move_home(); break;
    case KeyPress::End: doc.move_end(); break;
    case KeyPress::Escape: mode = Mode::Command; cmdline.clear(); break;
    case KeyPress::Ctrl:
      switch (k.ch) {
        case U's': save(); break;
        case U'z': undo(); break;
        case U'y': redo(); break;
        case U'q': quit(false); break;
        default: break;
      }
      break;
    default: break;
  }
}

void Editor::handle_command_input(const KeyPress& k) {
  switch (k.kind) {
    case KeyPress::Escape: mode = Mode::Insert; cmdline.clear(); break;
    case KeyPress::Backspace:
      if (!cmdline.empty()) {
        auto text = utf8_decode(cmdline);
        text.pop_back();
        cmdline = utf8_encode(text);
      }
      break;
    case KeyPress::Enter:
      mode = Mode::Insert;
      execute_command();
      cmdline.clear();
      break;
    case KeyPress::Char: utf8_append(cmdline, k.ch); break;
    default: break;
  }
}

void Editor::execute_command() {
  debug_log() << "command: " << cmdline << '\n';
  if (cmdline.find_first_not_of(' ') == std::string::npos) return;
  if (!registry.dispatch(cmdline)) message = "unknown command: " + cmdline;
}

void Editor::load_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  auto p = std::filesystem::path(home) / SLATE_RC_NAME;
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return;
  std::string raw;
  try {
    raw = read_file(p);
  } catch (const FileError& e) {
    message = e.what();
    return;
  }
  for (std::string s : split_lines(raw)) {
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    cmdline = s;
    try {
      execute_command();
    } catch (const BufferError& e) {
      message = e.what();
    }
  }
  cmdline.clear();
}

void Editor::exe(const Event& e) {
  bool needs_row = e.type == Event::Insert || e.type == Event::Remove || e.type == Event::SplitDown;
  if (needs_row && e.loc.y == doc.rows.size()) new_row();
  Status s = doc.execute(e);
  // Remove at column 0 and SpliceUp on the first row change nothing.
  bool noop = (e.type == Event::Remove || e.type == Event::SpliceUp) && s != Status::None;
  if (!noop) stack.exe(e);
}

void Editor::new_row() {
  Event e = Event::insert_row(doc.rows.size(), "");
  doc.execute(e);
  stack.exe(e);
}

void Editor::type_char(char32_t ch) {
  exe(Event::insert({doc.char_ptr, doc.loc().y}, ch));
  if (ch == U' ' || ch == U'\t') stack.commit();
}

void Editor::enter() {
  exe(Event::split_down({doc.char_ptr, doc.loc().y}));
  stack.commit();
}

void Editor::backspace() {
  size_t y = doc.loc().y;
  if (doc.char_ptr > 0) {
    char32_t ch = doc.current_row().char_at(doc.char_ptr - 1);
    exe(Event::remove({doc.char_ptr, y}, ch));
    return;
  }
  if (y == 0) return;
  if (y >= doc.rows.size()) {
    wrap_left();
    return;
  }
  exe(Event::splice_up({doc.row(y - 1).len(), y}));
  stack.commit();
}

void Editor::wrap_left() {
  if (doc.move_up() == Status::None) doc.move_end();
}

void Editor::wrap_right() {
  if (doc.move_down() == Status::None) doc.move_home();
}

void Editor::undo() {
  if (!apply_undo(doc, stack)) message = "already at oldest change";
}

void Editor::redo() {
  if (!apply_redo(doc, stack)) message = "already at newest change";
}

void Editor::save() {
  doc.save();
  message = "written " + doc.info.file->string();
}

void Editor::quit(bool force) {
  if (!force && doc.modified && !quit_warned) {
    quit_warned = true;
    message = "unsaved changes, quit again to discard them";
    return;
  }
  if (doc.modified) exit_status = EXIT_FAILURE;
  should_quit = true;
}

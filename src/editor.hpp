#pragma once
/*
 * Editor
 *
 * Purpose: interactive shell around one Document: key dispatch, undo
 * journal, command line, rc file.
 * Flow: every edit goes through exe(), which runs the event on the document
 * and records it in the EditStack once it has taken effect.
 * Errors: BufferError from the engine is shown on the message line.
 */
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include "cmd_registry.hpp"
#include "document.hpp"
#include "edit_stack.hpp"
#include "ncurses_terminal.hpp"
#include "renderer.hpp"
#include "types.hpp"

class Editor {
public:
  explicit Editor(const std::optional<std::filesystem::path>& file);
  // Returns the process exit status: nonzero when unsaved changes were discarded.
  int run();

private:
  Document doc{Size{}};
  EditStack stack;
  NcursesTerminal term;
  Renderer renderer;
  CommandRegistry registry;

  Mode mode = Mode::Insert;
  bool show_line_numbers = true;
  bool should_quit = false;
  bool quit_warned = false;
  int exit_status = EXIT_SUCCESS;
  std::string message;
  std::string cmdline;

  void render();
  void resize();
  void handle_input(const KeyPress& k);
  void handle_insert_input(const KeyPress& k);
  void handle_command_input(const KeyPress& k);
  void execute_command();
  void register_commands();
  void load_rc();

  void exe(const Event& e);
  void new_row();
  void type_char(char32_t ch);
  void enter();
  void backspace();
  void wrap_left();
  void wrap_right();
  void undo();
  void redo();
  void save();
  void quit(bool force);
};

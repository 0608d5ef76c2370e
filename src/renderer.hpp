#pragma once
/*
 * Renderer
 *
 * Purpose: draw the visible rows, line-number gutter, status line and
 * message/command line of one Document.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; scrolling is owned by Document, the renderer only
 * reads cursor/offset.
 */
#include <string>
#include "document.hpp"
#include "iterminal.hpp"
#include "types.hpp"

struct RenderOptions {
  bool show_line_numbers = true;
  Mode mode = Mode::Insert;
  std::string message;
  std::string cmdline;
};

class Renderer {
public:
  // Columns taken by the gutter for this document, 0 when hidden.
  static int gutter_width(const Document& doc, bool show_line_numbers);
  void render(ITerminal& term, const Document& doc, const RenderOptions& opt);
};

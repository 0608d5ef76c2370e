#include "renderer.hpp"
#include <algorithm>
#include "status_line.hpp"

static constexpr const char* GUTTER_SEP = " │ ";

int Renderer::gutter_width(const Document& doc, bool show_line_numbers) {
  if (!show_line_numbers) return 0;
  return static_cast<int>(doc.line_number(0).size()) + 3;
}

void Renderer::render(ITerminal& term, const Document& doc, const RenderOptions& opt) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = std::max(0, rows - 2);
  int indent = gutter_width(doc, opt.show_line_numbers);
  size_t text_cols = static_cast<size_t>(std::max(0, cols - indent));

  for (int i = 0; i < max_text_rows; ++i) {
    size_t idx = doc.offset.y + static_cast<size_t>(i);
    if (idx >= doc.rows.size()) {
      term.draw_text(i, 0, "~");
      continue;
    }
    if (indent > 0) term.draw_text(i, 0, doc.line_number(idx) + GUTTER_SEP);
    std::string vis = clip_to_width(doc.rows[idx].render(doc.offset.x), text_cols);
    term.draw_text(i, indent, vis);
    term.clear_to_eol(i, indent + static_cast<int>(Row(vis).width()));
  }

  auto info = doc.status_line_info();
  std::string lhs = " " + info["file"] + info["modified"] + " │ " + info["type"] + " │";
  std::string rhs = info["row"] + "/" + info["total"] + " (" + info["column"] + ") ";
  auto status = align_sides(lhs, rhs, static_cast<size_t>(std::max(0, cols)), doc.info.tab_width);
  if (rows >= 2) {
    term.draw_reversed(rows - 2, 0, status ? *status : clip_to_width(lhs, static_cast<size_t>(std::max(0, cols))));
  }

  std::string bottom = opt.mode == Mode::Command ? ":" + opt.cmdline : opt.message;
  if (rows >= 1) term.draw_text(rows - 1, 0, clip_to_width(bottom, static_cast<size_t>(std::max(0, cols))));

  if (opt.mode == Mode::Command) {
    term.move_cursor(rows - 1, std::min(cols - 1, 1 + static_cast<int>(Row(opt.cmdline).width())));
  } else {
    int screen_col = indent + static_cast<int>(doc.cursor.x);
    term.move_cursor(static_cast<int>(doc.cursor.y), std::min(screen_col, std::max(0, cols - 1)));
  }
  term.refresh();
}

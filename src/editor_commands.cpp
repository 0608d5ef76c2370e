#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include "error.hpp"

void Editor::register_commands() {
  registry.register_command("w", [this](const std::vector<std::string>& args){
    if (args.empty()) { save(); return; }
    std::filesystem::path p(args[0]);
    if (!doc.info.file) {
      doc.info.file = p;
      save();
      return;
    }
    doc.save_as(p);
    message = "written " + p.string();
  });
  registry.register_command("q", [this](const std::vector<std::string>&){ quit(false); });
  registry.register_command("q!", [this](const std::vector<std::string>&){ quit(true); });
  registry.register_command("wq", [this](const std::vector<std::string>&){
    save();
    quit(true);
  });
  registry.register_command("set number", [this](const std::vector<std::string>& args){
    if (args.empty()) { show_line_numbers = !show_line_numbers; }
    else if (args[0] == "on") { show_line_numbers = true; }
    else if (args[0] == "off") { show_line_numbers = false; }
    else { message = "set number: use :set number on|off"; return; }
    message = show_line_numbers ? "number on" : "number off";
  });
  registry.register_command("set tabwidth", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "set tabwidth: use :set tabwidth <width>"; return; }
    const std::string& s = args[0];
    bool ok = !s.empty() && s.size() <= 4 &&
              std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { message = "set tabwidth: width must be a number"; return; }
    doc.set_tab_width(static_cast<size_t>(std::stoi(s)));
    message = "tabwidth " + s;
  });
}

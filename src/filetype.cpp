#include "filetype.hpp"
#include <cctype>
#include <unordered_map>

static std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static const std::unordered_map<std::string, std::string>& filetype_table() {
  static const std::unordered_map<std::string, std::string> table = {
    {"c", "C"}, {"h", "C Header"},
    {"cpp", "C++"}, {"cxx", "C++"}, {"cc", "C++"}, {"hpp", "C++ Header"}, {"hxx", "C++ Header"}, {"hh", "C++ Header"},
    {"cmake", "CMake"}, {"mk", "Makefile"},
    {"rs", "Rust"}, {"go", "Go"}, {"py", "Python"}, {"rb", "Ruby"}, {"lua", "Lua"},
    {"js", "JavaScript"}, {"ts", "TypeScript"}, {"java", "Java"}, {"kt", "Kotlin"}, {"cs", "C#"},
    {"swift", "Swift"}, {"hs", "Haskell"}, {"ml", "OCaml"}, {"php", "PHP"}, {"pl", "Perl"},
    {"sh", "Shell"}, {"bash", "Shell"}, {"zsh", "Shell"}, {"fish", "Fish"},
    {"html", "HTML"}, {"htm", "HTML"}, {"css", "CSS"}, {"xml", "XML"},
    {"json", "JSON"}, {"toml", "TOML"}, {"yaml", "YAML"}, {"yml", "YAML"}, {"ini", "INI"},
    {"md", "Markdown"}, {"txt", "Plain Text"}, {"csv", "CSV"}, {"sql", "SQL"},
  };
  return table;
}

std::string filetype_for_extension(const std::string& ext) {
  const auto& table = filetype_table();
  auto it = table.find(to_lower(ext));
  if (it == table.end()) return "Unknown";
  return it->second;
}

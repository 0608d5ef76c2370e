#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch `:` commands typed by the user or read
 * from the rc file.
 * Names: a command may be one word ("w") or two ("set tabwidth"); dispatch
 * tries the two-word name first so options share the `set` prefix.
 */
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

class CommandRegistry {
public:
  using Args = std::vector<std::string>;
  using Handler = std::function<void(const Args&)>;

  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }

  // Returns false when no command matches the line.
  bool dispatch(const std::string& line) const {
    std::istringstream iss(line);
    Args words;
    std::string w;
    while (iss >> w) words.push_back(w);
    if (words.empty()) return false;
    if (words.size() >= 2) {
      auto it = map_.find(words[0] + " " + words[1]);
      if (it != map_.end()) {
        it->second(Args(words.begin() + 2, words.end()));
        return true;
      }
    }
    auto it = map_.find(words[0]);
    if (it == map_.end()) return false;
    it->second(Args(words.begin() + 1, words.end()));
    return true;
  }

private:
  std::unordered_map<std::string, Handler> map_;
};

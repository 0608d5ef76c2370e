#include "edit_stack.hpp"
#include <algorithm>
#include "debug_log.hpp"
#include "document.hpp"

void EditStack::exe(const Event& e) {
  patch_.push_back(e);
  undone_.clear();
}

void EditStack::commit() {
  if (patch_.empty()) return;
  done_.push_back(std::move(patch_));
  patch_.clear();
}

bool EditStack::can_undo() const { return !done_.empty() || !patch_.empty(); }
bool EditStack::can_redo() const { return !undone_.empty(); }

std::optional<Patch> EditStack::undo() {
  commit();
  if (done_.empty()) return std::nullopt;
  Patch p = std::move(done_.back());
  done_.pop_back();
  std::reverse(p.begin(), p.end());
  undone_.push_back(p);
  return p;
}

std::optional<Patch> EditStack::redo() {
  if (undone_.empty()) return std::nullopt;
  Patch p = std::move(undone_.back());
  undone_.pop_back();
  std::reverse(p.begin(), p.end());
  done_.push_back(p);
  return p;
}

bool apply_undo(Document& doc, EditStack& stack) {
  std::optional<Patch> p = stack.undo();
  if (!p) return false;
  debug_log() << "undo: " << p->size() << " event(s)\n";
  for (const Event& e : *p) doc.execute(inverse(e));
  return true;
}

bool apply_redo(Document& doc, EditStack& stack) {
  std::optional<Patch> p = stack.redo();
  if (!p) return false;
  debug_log() << "redo: " << p->size() << " event(s)\n";
  for (const Event& e : *p) doc.execute(e);
  return true;
}

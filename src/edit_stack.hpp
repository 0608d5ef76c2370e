#pragma once
/*
 * EditStack
 *
 * Purpose: undo/redo journal. Events accumulate in an open patch; commit()
 * closes it into one undo unit. The client decides the granularity.
 * Rule: exe() clears the redo history.
 */
#include <optional>
#include <vector>
#include "event.hpp"

class Document;

using Patch = std::vector<Event>;

class EditStack {
public:
  void exe(const Event& e);
  void commit();
  // Most recent patch in reverse order, for replay through inverse(). Commits
  // the open patch first.
  std::optional<Patch> undo();
  // Most recently undone patch in forward order, for replay through execute().
  std::optional<Patch> redo();

  bool can_undo() const;
  bool can_redo() const;
  const Patch& open_patch() const { return patch_; }
  size_t undo_size() const { return done_.size(); }
  size_t redo_size() const { return undone_.size(); }

private:
  Patch patch_;
  std::vector<Patch> done_;
  std::vector<Patch> undone_;
};

// Pop a patch and replay it on doc. Return false when there was nothing to do.
bool apply_undo(Document& doc, EditStack& stack);
bool apply_redo(Document& doc, EditStack& stack);

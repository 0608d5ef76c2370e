#include "event.hpp"

Event inverse(const Event& e) {
  switch (e.type) {
    case Event::Insert: return Event::remove({e.loc.x + 1, e.loc.y}, e.ch);
    case Event::Remove: return Event::insert({e.loc.x == 0 ? 0 : e.loc.x - 1, e.loc.y}, e.ch);
    case Event::InsertRow: return Event::remove_row(e.loc.y, e.text);
    case Event::RemoveRow: return Event::insert_row(e.loc.y, e.text);
    case Event::SplitDown: return Event::splice_up({e.loc.x, e.loc.y + 1});
    case Event::SpliceUp: return Event::split_down({e.loc.x, e.loc.y == 0 ? 0 : e.loc.y - 1});
  }
  return e;
}

const char* event_name(Event::Type t) {
  switch (t) {
    case Event::Insert: return "Insert";
    case Event::Remove: return "Remove";
    case Event::InsertRow: return "InsertRow";
    case Event::RemoveRow: return "RemoveRow";
    case Event::SplitDown: return "SplitDown";
    case Event::SpliceUp: return "SpliceUp";
  }
  return "?";
}

const char* status_name(Status s) {
  switch (s) {
    case Status::None: return "None";
    case Status::StartOfRow: return "StartOfRow";
    case Status::EndOfRow: return "EndOfRow";
    case Status::StartOfDocument: return "StartOfDocument";
    case Status::EndOfDocument: return "EndOfDocument";
  }
  return "?";
}

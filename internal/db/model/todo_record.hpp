#pragma once

#include <cstdint>
#include <string>

namespace todolist::db::model {

/*
  Persistent todo row.

  - id is assigned by the backend on insert and never reused.
  - completed is always 0 or 1 once written.
*/

struct TodoRecord {
  std::int64_t id = 0;

  std::string title;

  int completed = 0;
};

} // namespace todolist::db::model

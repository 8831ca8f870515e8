#pragma once

#include <string>
#include <string_view>

namespace todolist::util {

/*
  String helpers (ASCII only).
*/

std::string_view Trim(std::string_view s);
std::string      ToLower(std::string_view s);

inline bool IsBlank(std::string_view s) {
  return Trim(s).empty();
}

} // namespace todolist::util

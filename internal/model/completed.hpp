#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace todolist::model {

/*
  Raw "completed" input as it arrives from a caller.

  std::monostate stands for an absent / null value.
*/
using CompletedValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

/*
  Result of coercing a CompletedValue.

  Unspecified means the input carried no usable flag; the caller
  decides the default (false on insert, keep-existing on update).
*/
enum class Coerced {
  Unspecified = 0,
  False,
  True
};

Coerced CoerceCompleted(const CompletedValue& value);

// Same string rule as CoerceCompleted, for text read back from storage.
Coerced CoerceCompletedText(std::string_view text);

// 0/1 storage form; Unspecified resolves to `fallback`.
int ToStoredFlag(Coerced coerced, int fallback);

} // namespace todolist::model

#include "completed.hpp"

#include <cmath>

#include "internal/util/strings.hpp"

namespace todolist::model {

Coerced CoerceCompletedText(std::string_view text) {
  const auto v = util::ToLower(util::Trim(text));
  if (v == "true" || v == "1") return Coerced::True;
  if (v == "false" || v == "0") return Coerced::False;
  return Coerced::Unspecified;
}

Coerced CoerceCompleted(const CompletedValue& value) {
  if (const auto* b = std::get_if<bool>(&value)) {
    return *b ? Coerced::True : Coerced::False;
  }

  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return *i != 0 ? Coerced::True : Coerced::False;
  }

  // NaN is falsy
  if (const auto* d = std::get_if<double>(&value)) {
    return (*d != 0.0 && !std::isnan(*d)) ? Coerced::True : Coerced::False;
  }

  if (const auto* s = std::get_if<std::string>(&value)) {
    return CoerceCompletedText(*s);
  }

  return Coerced::Unspecified;
}

int ToStoredFlag(Coerced coerced, int fallback) {
  switch (coerced) {
    case Coerced::True:
      return 1;
    case Coerced::False:
      return 0;
    case Coerced::Unspecified:
      break;
  }
  return fallback;
}

} // namespace todolist::model

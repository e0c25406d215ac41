#pragma once

#include <string>

namespace pef::util {

/*
  Unicode NFC form of a UTF-8 string.

  File systems differ in the form they hand back (macOS stores decomposed
  names) while export titles are composed, so every name that takes part in
  matching goes through here. Text that is not valid UTF-8 is returned
  unchanged.
*/
std::string ToNfc(const std::string& text);

} // namespace pef::util

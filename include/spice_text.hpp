#pragma once
#include <cctype>
#include <string>

namespace spice { namespace detail {

// ASCII case folding shared by the normalizer, the parser and the control writer.
inline std::string to_lower(std::string s) {
  for (auto& c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

inline std::string to_upper(std::string s) {
  for (auto& c : s) c = (char)std::toupper((unsigned char)c);
  return s;
}

}} // namespace spice::detail

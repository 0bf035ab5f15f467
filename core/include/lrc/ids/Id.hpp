#pragma once
#include <cstdint>
#include <limits>
#include <string>

namespace lrc {

// Scene object id. Recipes own fixed blocks (see Recipe::rid); 0 is never valid.
using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Commands may carry ids as JSON strings. Only plain decimal digits that fit
// in 64 bits are accepted; `out` is written only on success.
inline bool parseIdString(const std::string& s, Id& out) {
  constexpr Id kMax = std::numeric_limits<Id>::max();
  if (s.empty()) return false;
  Id v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    const Id digit = static_cast<Id>(c - '0');
    if (v > (kMax - digit) / 10) return false;
    v = v * 10 + digit;
  }
  out = v;
  return true;
}

} // namespace lrc

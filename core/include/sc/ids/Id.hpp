#pragma once
#include <cstdint>
#include <string>

namespace sc {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Accepts decimal digit strings (JSON clients sometimes quote ids).
// Returns kInvalidId for anything else.
inline Id parseIdString(const std::string& s) {
  if (s.empty()) return kInvalidId;
  std::uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return kInvalidId;
    v = v * 10 + static_cast<std::uint64_t>(c - '0');
  }
  return static_cast<Id>(v);
}

} // namespace sc

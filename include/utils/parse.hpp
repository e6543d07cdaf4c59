#pragma once
#include <cctype>
#include <stdexcept>
#include <string>

// Whole-string integer parse. std::stoll alone stops at the first bad
// character ("17e8" -> 17); this rejects anything it did not consume.
// base 0 accepts 0x-hex as well as decimal.
inline bool ParseInt64(const std::string& s, long long& out, int base = 10) {
  if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return false;
  size_t pos = 0;
  long long v = 0;
  try {
    v = std::stoll(s, &pos, base);
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
  if (pos != s.size()) return false;
  out = v;
  return true;
}

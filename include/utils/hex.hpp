#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include "common/errors.hpp"

inline std::string Ensure0x(const std::string& in) {
  if (in.size() >= 2 && (in[0] == '0') && (in[1] == 'x' || in[1] == 'X')) return in;
  return std::string("0x") + in;
}

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

inline int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  return -1;
}

// Strict decode: odd length or a non-hex character raises ParseError
inline std::vector<unsigned char> HexToBytes(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.size() % 2 != 0) throw ParseError("odd-length hex string");
  std::vector<unsigned char> out; out.reserve(s.size() / 2);
  for (size_t i = 0; i < s.size(); i += 2) {
    int hi = HexNibble(s[i]), lo = HexNibble(s[i + 1]);
    if (hi < 0 || lo < 0) throw ParseError("invalid hex character in '" + hex + "'");
    out.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return out;
}

inline std::string BytesToHex0x(const unsigned char* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(len * 2 + 2); out += "0x";
  for (size_t i = 0; i < len; ++i) { unsigned char b = data[i]; out += hex[b >> 4]; out += hex[b & 0xF]; }
  return out;
}

inline std::string BytesToHex0x(const std::vector<unsigned char>& data) {
  return BytesToHex0x(data.data(), data.size());
}

// Addresses compare case-insensitively (EIP-55 checksums only change case)
inline bool SameAddress(const std::string& a, const std::string& b) {
  return ToLowerHex(Ensure0x(a)) == ToLowerHex(Ensure0x(b));
}

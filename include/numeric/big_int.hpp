#pragma once
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

// Arbitrary-precision integer used for every on-chain quantity. Fixed-width
// types overflow for large-supply tokens (10^18 scaling).
using BigInt = boost::multiprecision::cpp_int;

namespace BigInts {
  // Parses a base-10 non-negative integer string; ParseError otherwise
  BigInt FromDecimalString(const std::string& s);
  // Parses 0x-hex (empty digits read as zero); ParseError on bad characters
  BigInt FromHex(const std::string& hex);
  std::string ToDecimalString(const BigInt& v);
  // 0x-prefixed minimal hex ("0x0" for zero), JSON-RPC quantity form
  std::string ToHexQuantity(const BigInt& v);
  // 10^exp
  BigInt Pow10(unsigned exp);
}

#include "numeric/big_int.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"

namespace BigInts {
  BigInt FromDecimalString(const std::string& s) {
    if (s.empty()) throw ParseError("empty integer string");
    BigInt out = 0;
    for (char c : s) {
      if (c < '0' || c > '9') throw ParseError("not a base-10 integer: '" + s + "'");
      out *= 10;
      out += (c - '0');
    }
    return out;
  }

  BigInt FromHex(const std::string& hex) {
    std::string s = Strip0x(hex);
    BigInt out = 0;
    for (char c : s) {
      int n = HexNibble(c);
      if (n < 0) throw ParseError("not a hex quantity: '" + hex + "'");
      out <<= 4;
      out += n;
    }
    return out;
  }

  std::string ToDecimalString(const BigInt& v) {
    return v.str();
  }

  std::string ToHexQuantity(const BigInt& v) {
    if (v == 0) return "0x0";
    static const char* digits = "0123456789abcdef";
    std::string rev;
    BigInt x = v;
    while (x > 0) {
      rev.push_back(digits[static_cast<unsigned>(x & 0xF)]);
      x >>= 4;
    }
    return "0x" + std::string(rev.rbegin(), rev.rend());
  }

  BigInt Pow10(unsigned exp) {
    return boost::multiprecision::pow(BigInt(10), exp);
  }
}

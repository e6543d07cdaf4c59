#include "numeric/decimal_converter.hpp"
#include "common/errors.hpp"
#include <string>

static void RequireDecimals(int decimals) {
  if (decimals < 0) throw ParseError("negative decimal count " + std::to_string(decimals));
}

static std::string GroupThousands(const std::string& digits) {
  std::string out;
  out.reserve(digits.size() + digits.size() / 3);
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (digits.size() - i) % 3 == 0) out.push_back(',');
    out.push_back(digits[i]);
  }
  return out;
}

namespace DecimalConverter {
  BigInt ToWei(const std::string& amount) {
    if (amount.empty()) throw ParseError("empty amount");
    if (amount[0] == '-') throw ParseError("negative amount '" + amount + "'");
    auto dot = amount.find('.');
    std::string whole = amount.substr(0, dot);
    std::string frac = dot == std::string::npos ? std::string() : amount.substr(dot + 1);
    if (whole.empty() && frac.empty()) throw ParseError("no digits in amount '" + amount + "'");
    for (char c : whole + frac) {
      if (c < '0' || c > '9') throw ParseError("non-numeric amount '" + amount + "'");
    }
    if (frac.size() > static_cast<size_t>(kWeiDecimals)) frac.resize(kWeiDecimals);
    frac.append(kWeiDecimals - frac.size(), '0');
    std::string digits = whole + frac;
    return BigInts::FromDecimalString(digits);
  }

  BigInt ToBaseUnits(const std::string& amount, int decimals) {
    return Rescale(ToWei(amount), kWeiDecimals, decimals);
  }

  BigInt Rescale(const BigInt& value, int from_decimals, int to_decimals) {
    RequireDecimals(from_decimals);
    RequireDecimals(to_decimals);
    if (to_decimals == from_decimals) return value;
    if (to_decimals > from_decimals) return value * BigInts::Pow10(static_cast<unsigned>(to_decimals - from_decimals));
    return value / BigInts::Pow10(static_cast<unsigned>(from_decimals - to_decimals));
  }

  std::string Format(const BigInt& raw, int decimals, int display_decimals, bool include_commas) {
    RequireDecimals(decimals);
    if (display_decimals < 0) display_decimals = 0;
    if (raw < 0) throw ParseError("negative base-unit value");
    BigInt scale = BigInts::Pow10(static_cast<unsigned>(decimals));
    BigInt whole = raw / scale;
    BigInt rem = raw % scale;

    std::string whole_str = whole.str();
    if (include_commas) whole_str = GroupThousands(whole_str);

    // rem zero-padded to `decimals` digits, then cut to display precision
    std::string frac = rem.str();
    if (frac.size() < static_cast<size_t>(decimals)) frac.insert(0, decimals - frac.size(), '0');
    if (rem == 0) frac.clear();
    if (frac.size() > static_cast<size_t>(display_decimals)) frac.resize(display_decimals);
    while (!frac.empty() && frac.back() == '0') frac.pop_back();

    return frac.empty() ? whole_str : whole_str + "." + frac;
  }

  std::string Format(const std::string& raw, int decimals, int display_decimals, bool include_commas) {
    return Format(BigInts::FromDecimalString(raw), decimals, display_decimals, include_commas);
  }
}

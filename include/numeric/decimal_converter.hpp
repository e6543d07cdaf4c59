#pragma once
#include <string>
#include "numeric/big_int.hpp"

// Human amount <-> base-unit conversion. Amounts are plain decimal strings
// ("12", "0.5", "1000.000001"); signs, exponents and separators are rejected.
namespace DecimalConverter {
  constexpr int kWeiDecimals = 18;
  constexpr int kDisplayDecimals = 4;

  // amount * 10^18, fractional digits beyond the 18th are truncated
  BigInt ToWei(const std::string& amount);
  // ToWei then Rescale(.., 18, decimals)
  BigInt ToBaseUnits(const std::string& amount, int decimals);
  // Up-scaling is exact, down-scaling truncates toward zero
  BigInt Rescale(const BigInt& value, int from_decimals, int to_decimals);
  // raw / 10^decimals truncated to display_decimals fractional digits, trailing zeros dropped
  std::string Format(const BigInt& raw, int decimals, int display_decimals, bool include_commas);
  // Format() for base-unit integers carried as decimal strings
  std::string Format(const std::string& raw, int decimals, int display_decimals, bool include_commas);
}

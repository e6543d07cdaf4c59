#include "encoding/rlp.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

namespace {
  constexpr unsigned char kStringOffset = 0x80;
  constexpr unsigned char kListOffset = 0xC0;
  constexpr size_t kShortLimit = 55;

  // Prefix for a payload of `len` bytes: one byte up to 55, else 0xb7/0xf7 + length-of-length
  std::vector<unsigned char> Header(size_t len, unsigned char offset) {
    if (len <= kShortLimit) return { static_cast<unsigned char>(offset + len) };
    std::vector<unsigned char> len_be;
    for (size_t tmp = len; tmp; tmp >>= 8) len_be.insert(len_be.begin(), static_cast<unsigned char>(tmp & 0xFF));
    std::vector<unsigned char> out{ static_cast<unsigned char>(offset + kShortLimit + len_be.size()) };
    out.insert(out.end(), len_be.begin(), len_be.end());
    return out;
  }

  std::string Wrap(const std::vector<unsigned char>& payload, unsigned char offset) {
    auto out = Header(payload.size(), offset);
    out.insert(out.end(), payload.begin(), payload.end());
    return BytesToHex0x(out);
  }
}

namespace RLP {
  std::string EncodeBytes(const std::vector<unsigned char>& data) {
    // a single byte below 0x80 is its own encoding
    if (data.size() == 1 && data[0] < kStringOffset) return BytesToHex0x(data);
    return Wrap(data, kStringOffset);
  }

  std::string EncodeString(const std::string& hex0x) {
    return EncodeBytes(HexToBytes(hex0x));
  }

  std::string EncodeAddress(const std::string& address) {
    auto bytes = HexToBytes(address);
    if (!bytes.empty() && bytes.size() != 20) throw ParseError("address must be 20 bytes: '" + address + "'");
    return EncodeBytes(bytes);
  }

  std::string EncodeUint(const BigInt& value) {
    if (value < 0) throw std::invalid_argument("RLP integer cannot be negative");
    std::vector<unsigned char> be;
    for (BigInt v = value; v > 0; v >>= 8) be.insert(be.begin(), static_cast<unsigned char>(static_cast<unsigned>(v & 0xFF)));
    return EncodeBytes(be);
  }

  std::string EncodeList(const std::vector<std::string>& elements) {
    std::vector<unsigned char> payload;
    for (const auto& e : elements) {
      auto bytes = HexToBytes(e);
      payload.insert(payload.end(), bytes.begin(), bytes.end());
    }
    return Wrap(payload, kListOffset);
  }
}

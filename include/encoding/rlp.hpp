#pragma once
#include <string>
#include <vector>
#include "numeric/big_int.hpp"

// Recursive Length Prefix encoding for typed transaction envelopes. Every
// encoder returns 0x-prefixed hex so that items nest through EncodeList.
namespace RLP {
  std::string EncodeBytes(const std::vector<unsigned char>& data);
  // Empty or "0x" encodes as the empty string
  std::string EncodeString(const std::string& hex0x);
  // 20-byte address; empty encodes as the empty string (contract creation)
  std::string EncodeAddress(const std::string& address);
  // Minimal big-endian; zero is the empty string. Negative values throw.
  std::string EncodeUint(const BigInt& value);
  // Elements must already be RLP-encoded
  std::string EncodeList(const std::vector<std::string>& elements);
}

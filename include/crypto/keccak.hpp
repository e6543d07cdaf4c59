#pragma once
#include <string>
#include <vector>
#include <cryptopp/keccak.h>

namespace Crypto {
  // Original Keccak-256 (0x01 padding), not NIST SHA3-256
  std::vector<unsigned char> Keccak256(const std::vector<unsigned char>& data);
  // 0x-prefixed hash of the input taken as raw bytes (function signatures, type strings)
  std::string Keccak256Raw(const std::string& raw);
  // 0x-prefixed hash of hex-encoded input
  std::string Keccak256Hex(const std::string& hex_input);

  // Incremental hashing for preimages assembled from several parts
  // (typed transaction envelopes, EIP-712 encodings).
  class Keccak256Hasher {
  public:
    Keccak256Hasher& Update(const std::vector<unsigned char>& data);
    Keccak256Hasher& Update(const std::string& raw);
    Keccak256Hasher& Update(unsigned char byte);
    // Returns the digest and resets the hasher
    std::vector<unsigned char> Final();
  private:
    CryptoPP::Keccak_256 hash_;
  };
}

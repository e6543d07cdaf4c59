#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <string>

namespace Crypto {
  Keccak256Hasher& Keccak256Hasher::Update(const std::vector<unsigned char>& data) {
    hash_.Update(data.data(), data.size());
    return *this;
  }

  Keccak256Hasher& Keccak256Hasher::Update(const std::string& raw) {
    hash_.Update(reinterpret_cast<const CryptoPP::byte*>(raw.data()), raw.size());
    return *this;
  }

  Keccak256Hasher& Keccak256Hasher::Update(unsigned char byte) {
    hash_.Update(&byte, 1);
    return *this;
  }

  std::vector<unsigned char> Keccak256Hasher::Final() {
    std::vector<unsigned char> digest(CryptoPP::Keccak_256::DIGESTSIZE);
    hash_.Final(digest.data());
    return digest;
  }

  std::vector<unsigned char> Keccak256(const std::vector<unsigned char>& data) {
    return Keccak256Hasher().Update(data).Final();
  }

  std::string Keccak256Raw(const std::string& raw) {
    return BytesToHex0x(Keccak256Hasher().Update(raw).Final());
  }

  std::string Keccak256Hex(const std::string& hex_input) {
    return BytesToHex0x(Keccak256(HexToBytes(hex_input)));
  }
}

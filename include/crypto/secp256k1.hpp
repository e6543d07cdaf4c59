#pragma once
#include <string>
#include <vector>

namespace Crypto {
  struct Signature { std::vector<unsigned char> r; std::vector<unsigned char> s; unsigned char v = 27; };
  // Sign 32-byte digest with secp256k1; private key is 32-byte raw
  Signature SignDigest(const std::vector<unsigned char>& priv32, const std::vector<unsigned char>& digest32);
  // Derive uncompressed public key (65 bytes, 0x04 || X(32) || Y(32)) from private key
  std::vector<unsigned char> PublicKeyFromPrivate(const std::vector<unsigned char>& priv32);
  // Recover the uncompressed public key that produced sig over digest32.
  // Throws std::invalid_argument for malformed signatures, std::runtime_error if recovery fails.
  std::vector<unsigned char> RecoverPublicKey(const std::vector<unsigned char>& digest32, const Signature& sig);
  // 0x-prefixed lowercase address: last 20 bytes of keccak256(pub[1:])
  std::string AddressFromPublicKey(const std::vector<unsigned char>& pub65);

  // r || s || v, 65 bytes
  std::vector<unsigned char> SerializeSignature(const Signature& sig);
  // Accepts v as 0/1 or 27/28
  Signature ParseSignature(const std::vector<unsigned char>& sig65);
}

#pragma once
#include <string>
#include <vector>
#include "crypto/secp256k1.hpp"
#include "numeric/big_int.hpp"

struct TransactionFields {
  long long chain_id = 1;
  unsigned long long nonce = 0;
  unsigned long long gas_limit = 0;
  unsigned long long max_fee_per_gas = 0; // wei
  unsigned long long max_priority_fee_per_gas = 0; // wei
  std::string to; // 0x...
  BigInt value = 0; // wei
  std::string data; // 0x...
};

// Holds a raw secp256k1 private key and signs with it.
class Signer {
public:
  explicit Signer(const std::string& private_key_hex);
  // Raw 0x02-typed transaction, ready for eth_sendRawTransaction
  std::string SignEip1559(const TransactionFields& tx) const;
  // Recoverable signature over an arbitrary 32-byte digest (EIP-712 hashes)
  Crypto::Signature SignDigest(const std::vector<unsigned char>& digest32) const;
  std::string Address() const;
private:
  std::vector<unsigned char> priv_;
  std::string address_;
};

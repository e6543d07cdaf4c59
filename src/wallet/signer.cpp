#include "wallet/signer.hpp"
#include "crypto/keccak.hpp"
#include "crypto/secp256k1.hpp"
#include "encoding/rlp.hpp"
#include "utils/hex.hpp"
#include <stdexcept>
#include <vector>
#include <string>

static constexpr unsigned char kEip1559TxType = 0x02;

// r and s go into RLP as big-endian integers, so leading zero bytes are dropped
static std::vector<unsigned char> StripLeadingZeros(const std::vector<unsigned char>& in) {
  size_t i = 0;
  while (i < in.size() && in[i] == 0) ++i;
  return std::vector<unsigned char>(in.begin() + i, in.end());
}

Signer::Signer(const std::string& private_key_hex) {
  if (private_key_hex.empty()) throw std::invalid_argument("empty private key");
  priv_ = HexToBytes(private_key_hex);
  if (priv_.size() != 32) throw std::invalid_argument("invalid private key length");
  address_ = Crypto::AddressFromPublicKey(Crypto::PublicKeyFromPrivate(priv_));
}

std::string Signer::SignEip1559(const TransactionFields& tx) const {
  // RLP: [chainId, nonce, maxPriorityFeePerGas, maxFeePerGas, gasLimit, to, value, data, accessList]
  std::vector<std::string> core{
    RLP::EncodeUint(tx.chain_id),
    RLP::EncodeUint(tx.nonce),
    RLP::EncodeUint(tx.max_priority_fee_per_gas),
    RLP::EncodeUint(tx.max_fee_per_gas),
    RLP::EncodeUint(tx.gas_limit),
    RLP::EncodeAddress(tx.to),
    RLP::EncodeUint(tx.value),
    RLP::EncodeString(tx.data),
    RLP::EncodeList({})
  };
  // sighash = keccak256(0x02 || rlp(core))
  auto sighash = Crypto::Keccak256Hasher()
    .Update(static_cast<unsigned char>(kEip1559TxType))
    .Update(HexToBytes(RLP::EncodeList(core)))
    .Final();
  auto sig = SignDigest(sighash);

  // Append yParity, r, s
  std::vector<std::string> full = core;
  full.push_back(RLP::EncodeUint(sig.v - 27));
  full.push_back(RLP::EncodeBytes(StripLeadingZeros(sig.r)));
  full.push_back(RLP::EncodeBytes(StripLeadingZeros(sig.s)));
  auto rlp_full = RLP::EncodeList(full);
  // typed tx: 0x02 || rlp_full
  return std::string("0x02") + Strip0x(rlp_full);
}

Crypto::Signature Signer::SignDigest(const std::vector<unsigned char>& digest32) const {
  return Crypto::SignDigest(priv_, digest32);
}

std::string Signer::Address() const { return address_; }


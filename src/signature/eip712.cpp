#include "signature/eip712.hpp"
#include "crypto/keccak.hpp"
#include "encoding/abi.hpp"
#include "protocols/token_erc20.hpp"

namespace {
  std::vector<unsigned char> HashString(const std::string& s) {
    return Crypto::Keccak256Hasher().Update(s).Final();
  }
}

namespace EIP712 {
  std::vector<unsigned char> TypeHash(const std::string& type) {
    return HashString(type);
  }

  std::vector<unsigned char> DomainSeparator(const Domain& domain) {
    // string members are encoded as the hash of their contents
    return Crypto::Keccak256Hasher()
      .Update(TypeHash(kDomainType))
      .Update(HashString(domain.name))
      .Update(HashString(domain.version))
      .Update(ABI::EncodeUint(BigInt(domain.chain_id)))
      .Update(ABI::EncodeAddress(domain.verifying_contract))
      .Final();
  }

  std::vector<unsigned char> StructHash(const Token::MintRequest& req) {
    return Crypto::Keccak256Hasher()
      .Update(TypeHash(kMintRequestType))
      .Update(TokenERC20::EncodeMintRequest(req))
      .Final();
  }

  std::vector<unsigned char> Digest(const Domain& domain, const Token::MintRequest& req) {
    return Crypto::Keccak256Hasher()
      .Update(static_cast<unsigned char>(0x19))
      .Update(static_cast<unsigned char>(0x01))
      .Update(DomainSeparator(domain))
      .Update(StructHash(req))
      .Final();
  }
}

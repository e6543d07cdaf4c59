#pragma once
#include <string>
#include <vector>
#include "token/types.hpp"

// EIP-712 hashing for TokenERC20 mint vouchers
namespace EIP712 {
  constexpr const char* kDomainType =
    "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)";
  constexpr const char* kMintRequestType =
    "MintRequest(address to,address primarySaleRecipient,uint256 quantity,uint256 price,address currency,"
    "uint128 validityStartTimestamp,uint128 validityEndTimestamp,bytes32 uid)";

  struct Domain {
    std::string name;
    std::string version = "1";
    long long chain_id = 1;
    std::string verifying_contract;
  };

  std::vector<unsigned char> TypeHash(const std::string& type);
  std::vector<unsigned char> DomainSeparator(const Domain& domain);
  std::vector<unsigned char> StructHash(const Token::MintRequest& req);
  // keccak256(0x19 0x01 || domainSeparator || structHash)
  std::vector<unsigned char> Digest(const Domain& domain, const Token::MintRequest& req);
}

#pragma once
#include <string>
#include <vector>
#include "encoding/abi.hpp"
#include "token/types.hpp"

class ContractReader;

// Signature-mint surface of the TokenERC20 contract
namespace TokenERC20 {
  // Tuple form of MintRequest used in function signatures
  constexpr const char* kMintRequestTuple = "(address,address,uint256,uint256,address,uint128,uint128,bytes32)";

  // All eight fields are static, so the tuple is encoded inline (8 words)
  ABI::Bytes EncodeMintRequest(const Token::MintRequest& req);

  std::string PrimarySaleRecipient(ContractReader& reader, const std::string& token);

  struct VerifyResult { bool success = false; std::string signer; };
  // verify(MintRequest, bytes) view on the token contract
  VerifyResult Verify(ContractReader& reader, const std::string& token,
                      const Token::MintRequest& req, const std::vector<unsigned char>& signature);

  std::string MintWithSignatureCall(const Token::MintRequest& req, const std::vector<unsigned char>& signature);
}

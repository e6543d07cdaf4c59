#pragma once
#include <string>
#include "token/types.hpp"

// Conversions between the human-facing mint voucher and the on-chain MintRequest.
// Quantity and price always use 18 decimals here, whatever the token's own decimals.
namespace VoucherCodec {
  // 10 years, in seconds
  constexpr long long kDefaultValiditySeconds = 10LL * 365 * 24 * 60 * 60 + 2 * 24 * 60 * 60;

  // Pure transform; ParseError on a malformed amount or a uid that is not 32 bytes of hex
  Token::MintRequest BuildMintRequest(const Token::MintPayload& payload, const std::string& primary_sale_recipient);

  // Fresh voucher valid from now for ten years with a random uid
  Token::MintPayload NewMintPayload(const std::string& to, const std::string& quantity);
  std::string RandomUid();

  Token::SignedPayloadOutput ToSignedPayloadOutput(const Token::MintRequest& req);
  Token::MintRequest RequestFromSignedPayload(const Token::SignedPayloadOutput& out);
}

#pragma once
#include <optional>
#include <string>
#include "signature/eip712.hpp"
#include "token/contract_io.hpp"
#include "token/types.hpp"

// Generates, verifies and redeems EIP-712 signed mint vouchers for one TokenERC20 contract.
class TypedDataSigner {
public:
  TypedDataSigner(ContractReader& reader, ContractWriter& writer, WalletContext& wallet, std::string token);

  // Signs with signing_key when given, otherwise with the wallet's signer
  Token::SignedPayload Generate(const Token::MintPayload& payload,
                                const std::optional<std::string>& signing_key = std::nullopt);
  // Local recovery first, then the contract's verify(); false on any disagreement
  bool Verify(const Token::SignedPayload& signed_payload);
  // SignatureMismatch when the signature does not recover to the signer the contract sees
  Token::TransactionResult Mint(const Token::SignedPayload& signed_payload);

  // Domain of this token on the wallet's chain (reads name())
  EIP712::Domain ResolveDomain();

  // Signs an already-built request with a raw private key
  static Token::SignedPayload SignRequest(const Token::MintRequest& req,
                                          const EIP712::Domain& domain,
                                          const std::string& private_key_hex);
  // Throws std::invalid_argument / std::runtime_error when recovery fails
  static std::string RecoverSigner(const Token::SignedPayload& signed_payload, const EIP712::Domain& domain);
  // quantity * price / 10^18 for native-currency vouchers, else zero
  static BigInt PayableValue(const Token::MintRequest& req);

private:
  ContractReader& reader_;
  ContractWriter& writer_;
  WalletContext& wallet_;
  std::string token_;

  std::string ResolvePrimarySaleRecipient(const Token::MintPayload& payload);
};

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config/runtime_config.hpp"
#include "token/types.hpp"

class ContractReader;
class ContractWriter;
class WalletContext;
class BridgeTransport;

// ERC20 operations of one token contract. Amounts are human decimal strings
// ("1.5"); reads come back as CurrencyValue in the token's own decimals.
class TokenOperations {
public:
  virtual ~TokenOperations() = default;

  virtual Token::Currency Get() = 0;
  virtual Token::CurrencyValue Balance() = 0;
  virtual Token::CurrencyValue BalanceOf(const std::string& address) = 0;
  virtual Token::CurrencyValue Allowance(const std::string& spender) = 0;
  virtual Token::CurrencyValue AllowanceOf(const std::string& owner, const std::string& spender) = 0;
  virtual Token::CurrencyValue TotalSupply() = 0;

  virtual Token::TransactionResult SetAllowance(const std::string& spender, const std::string& amount) = 0;
  virtual Token::TransactionResult Transfer(const std::string& to, const std::string& amount) = 0;
  virtual Token::TransactionResult TransferFrom(const std::string& from, const std::string& to, const std::string& amount) = 0;
  virtual Token::TransactionResult Burn(const std::string& amount) = 0;
  virtual Token::TransactionResult Claim(const std::string& amount) = 0;
  virtual Token::TransactionResult ClaimTo(const std::string& address, const std::string& amount) = 0;
  virtual Token::TransactionResult Mint(const std::string& amount) = 0;
  virtual Token::TransactionResult MintTo(const std::string& address, const std::string& amount) = 0;

  // Drop contracts
  virtual Token::ClaimCondition GetActiveClaimCondition() = 0;
  virtual bool CanClaim(const std::string& quantity, const std::optional<std::string>& address = std::nullopt) = 0;
  virtual std::vector<std::string> GetClaimIneligibilityReasons(const std::string& quantity,
                                                                const std::optional<std::string>& address = std::nullopt) = 0;
  virtual Token::ClaimerProofs GetClaimerProofs(const std::string& claimer) = 0;

  // Signature minting
  virtual Token::SignedPayload GenerateSignature(const Token::MintPayload& payload,
                                                 const std::optional<std::string>& private_key = std::nullopt) = 0;
  virtual bool VerifySignature(const Token::SignedPayload& signed_payload) = 0;
  virtual Token::TransactionResult MintWithSignature(const Token::SignedPayload& signed_payload) = 0;
};

// Collaborators owned by the host. Native needs reader, writer and wallet;
// Bridge needs bridge and wallet.
struct TokenContext {
  ContractReader* reader = nullptr;
  ContractWriter* writer = nullptr;
  WalletContext* wallet = nullptr;
  BridgeTransport* bridge = nullptr;
};

// Picks the implementation once for the runtime target. Throws
// std::invalid_argument when a collaborator that target needs is missing.
std::unique_ptr<TokenOperations> CreateTokenOperations(RuntimeTarget target,
                                                       const std::string& contract,
                                                       const TokenContext& ctx);

#pragma once
#include "token/token_operations.hpp"
#include "bridge/bridge_transport.hpp"

// Forwards every operation to the bridge under <contract>/erc20/...
class BridgeTokenOperations : public TokenOperations {
public:
  BridgeTokenOperations(std::string contract, BridgeTransport& bridge, WalletContext& wallet);

  Token::Currency Get() override;
  Token::CurrencyValue Balance() override;
  Token::CurrencyValue BalanceOf(const std::string& address) override;
  Token::CurrencyValue Allowance(const std::string& spender) override;
  Token::CurrencyValue AllowanceOf(const std::string& owner, const std::string& spender) override;
  Token::CurrencyValue TotalSupply() override;

  Token::TransactionResult SetAllowance(const std::string& spender, const std::string& amount) override;
  Token::TransactionResult Transfer(const std::string& to, const std::string& amount) override;
  Token::TransactionResult TransferFrom(const std::string& from, const std::string& to, const std::string& amount) override;
  Token::TransactionResult Burn(const std::string& amount) override;
  Token::TransactionResult Claim(const std::string& amount) override;
  Token::TransactionResult ClaimTo(const std::string& address, const std::string& amount) override;
  Token::TransactionResult Mint(const std::string& amount) override;
  Token::TransactionResult MintTo(const std::string& address, const std::string& amount) override;

  Token::ClaimCondition GetActiveClaimCondition() override;
  bool CanClaim(const std::string& quantity, const std::optional<std::string>& address) override;
  std::vector<std::string> GetClaimIneligibilityReasons(const std::string& quantity,
                                                        const std::optional<std::string>& address) override;
  // Throws UnsupportedOperation
  Token::ClaimerProofs GetClaimerProofs(const std::string& claimer) override;

  // Without a key the bridge's signature is returned as-is; with one the
  // voucher is re-signed here over the bridge's primary sale recipient.
  Token::SignedPayload GenerateSignature(const Token::MintPayload& payload,
                                         const std::optional<std::string>& private_key) override;
  bool VerifySignature(const Token::SignedPayload& signed_payload) override;
  Token::TransactionResult MintWithSignature(const Token::SignedPayload& signed_payload) override;

  std::string Route(const std::string& op) const;

private:
  std::string contract_;
  BridgeTransport& bridge_;
  WalletContext& wallet_;

  nlohmann::json Invoke(const std::string& op, const std::vector<std::string>& args = {});
};

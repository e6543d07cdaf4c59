#pragma once
#include "token/token_operations.hpp"
#include "token/contract_io.hpp"
#include "claim/claim_condition_resolver.hpp"
#include "signature/typed_data_signer.hpp"

// Talks to the contract directly through eth_call and signed transactions.
class LocalTokenOperations : public TokenOperations {
public:
  LocalTokenOperations(std::string contract, ContractReader& reader, ContractWriter& writer, WalletContext& wallet);

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
  // Merkle allowlists are not supported here; these three throw UnsupportedOperation
  bool CanClaim(const std::string& quantity, const std::optional<std::string>& address) override;
  std::vector<std::string> GetClaimIneligibilityReasons(const std::string& quantity,
                                                        const std::optional<std::string>& address) override;
  Token::ClaimerProofs GetClaimerProofs(const std::string& claimer) override;

  Token::SignedPayload GenerateSignature(const Token::MintPayload& payload,
                                         const std::optional<std::string>& private_key) override;
  bool VerifySignature(const Token::SignedPayload& signed_payload) override;
  Token::TransactionResult MintWithSignature(const Token::SignedPayload& signed_payload) override;

  // ToWei(amount) * pricePerToken / 10^18 for native-currency conditions, else zero
  static BigInt ClaimValue(const Token::ClaimCondition& condition, const std::string& amount);

private:
  std::string contract_;
  ContractReader& reader_;
  ContractWriter& writer_;
  WalletContext& wallet_;
  ClaimConditionResolver claims_;
  TypedDataSigner signer_;

  int Decimals();
  Token::TransactionResult Submit(const std::string& op, const std::string& calldata, const BigInt& value = 0);
};

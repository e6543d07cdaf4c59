#include "token/local_token_operations.hpp"
#include "protocols/erc20.hpp"
#include "protocols/drop_erc20.hpp"
#include "numeric/decimal_converter.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

LocalTokenOperations::LocalTokenOperations(std::string contract, ContractReader& reader, ContractWriter& writer, WalletContext& wallet)
  : contract_(std::move(contract)), reader_(reader), writer_(writer), wallet_(wallet),
    claims_(reader), signer_(reader, writer, wallet, contract_) {}

int LocalTokenOperations::Decimals() {
  return ERC20::Decimals(reader_, contract_);
}

Token::TransactionResult LocalTokenOperations::Submit(const std::string& op, const std::string& calldata, const BigInt& value) {
  Logger::Info(op + " on " + contract_ + (value > 0 ? " value=" + BigInts::ToDecimalString(value) : std::string()));
  auto res = writer_.Write(contract_, calldata, value);
  Logger::Info(op + " " + Token::ToString(res.status) + " tx=" + res.tx_hash);
  return res;
}

Token::Currency LocalTokenOperations::Get() {
  return ERC20::GetCurrency(reader_, contract_);
}

Token::CurrencyValue LocalTokenOperations::Balance() {
  return BalanceOf(wallet_.Address());
}

Token::CurrencyValue LocalTokenOperations::BalanceOf(const std::string& address) {
  auto c = Get();
  return Token::MakeCurrencyValue(c, ERC20::BalanceOf(reader_, contract_, address));
}

Token::CurrencyValue LocalTokenOperations::Allowance(const std::string& spender) {
  return AllowanceOf(wallet_.Address(), spender);
}

Token::CurrencyValue LocalTokenOperations::AllowanceOf(const std::string& owner, const std::string& spender) {
  auto c = Get();
  return Token::MakeCurrencyValue(c, ERC20::Allowance(reader_, contract_, owner, spender));
}

Token::CurrencyValue LocalTokenOperations::TotalSupply() {
  auto c = Get();
  return Token::MakeCurrencyValue(c, ERC20::TotalSupply(reader_, contract_));
}

Token::TransactionResult LocalTokenOperations::SetAllowance(const std::string& spender, const std::string& amount) {
  BigInt raw = DecimalConverter::ToBaseUnits(amount, Decimals());
  return Submit("approve", ERC20::ApproveCall(spender, raw));
}

Token::TransactionResult LocalTokenOperations::Transfer(const std::string& to, const std::string& amount) {
  BigInt raw = DecimalConverter::ToBaseUnits(amount, Decimals());
  return Submit("transfer", ERC20::TransferCall(to, raw));
}

Token::TransactionResult LocalTokenOperations::TransferFrom(const std::string& from, const std::string& to, const std::string& amount) {
  BigInt raw = DecimalConverter::ToBaseUnits(amount, Decimals());
  return Submit("transferFrom", ERC20::TransferFromCall(from, to, raw));
}

Token::TransactionResult LocalTokenOperations::Burn(const std::string& amount) {
  BigInt raw = DecimalConverter::ToBaseUnits(amount, Decimals());
  return Submit("burn", ERC20::BurnCall(raw));
}

Token::TransactionResult LocalTokenOperations::Claim(const std::string& amount) {
  return ClaimTo(wallet_.Address(), amount);
}

BigInt LocalTokenOperations::ClaimValue(const Token::ClaimCondition& condition, const std::string& amount) {
  if (!Token::IsNativeToken(condition.currency_address)) return 0;
  BigInt price = BigInts::FromDecimalString(condition.currency_metadata.value);
  return DecimalConverter::ToWei(amount) * price / BigInts::Pow10(DecimalConverter::kWeiDecimals);
}

Token::TransactionResult LocalTokenOperations::ClaimTo(const std::string& address, const std::string& amount) {
  auto condition = claims_.GetActive(contract_);
  // Claims are sized in the token's decimals, unlike signature vouchers
  BigInt quantity = DecimalConverter::ToBaseUnits(amount, Decimals());
  BigInt price = BigInts::FromDecimalString(condition.currency_metadata.value);

  DropERC20::AllowlistProof proof;
  proof.quantity_limit_per_wallet = BigInts::FromDecimalString(condition.max_claimable_per_wallet);
  proof.price_per_token = price;
  proof.currency = condition.currency_address;

  auto calldata = DropERC20::ClaimCall(address, quantity, condition.currency_address, price, proof, {});
  return Submit("claim", calldata, ClaimValue(condition, amount));
}

Token::TransactionResult LocalTokenOperations::Mint(const std::string& amount) {
  return MintTo(wallet_.Address(), amount);
}

Token::TransactionResult LocalTokenOperations::MintTo(const std::string& address, const std::string& amount) {
  BigInt raw = DecimalConverter::ToBaseUnits(amount, Decimals());
  return Submit("mintTo", ERC20::MintToCall(address, raw));
}

Token::ClaimCondition LocalTokenOperations::GetActiveClaimCondition() {
  return claims_.GetActive(contract_);
}

bool LocalTokenOperations::CanClaim(const std::string&, const std::optional<std::string>&) {
  throw UnsupportedOperation("canClaim requires allowlist support, not available on the native target");
}

std::vector<std::string> LocalTokenOperations::GetClaimIneligibilityReasons(const std::string&,
                                                                            const std::optional<std::string>&) {
  throw UnsupportedOperation("getClaimIneligibilityReasons is not available on the native target");
}

Token::ClaimerProofs LocalTokenOperations::GetClaimerProofs(const std::string&) {
  throw UnsupportedOperation("merkle allowlist proofs are not supported");
}

Token::SignedPayload LocalTokenOperations::GenerateSignature(const Token::MintPayload& payload,
                                                             const std::optional<std::string>& private_key) {
  return signer_.Generate(payload, private_key);
}

bool LocalTokenOperations::VerifySignature(const Token::SignedPayload& signed_payload) {
  return signer_.Verify(signed_payload);
}

Token::TransactionResult LocalTokenOperations::MintWithSignature(const Token::SignedPayload& signed_payload) {
  return signer_.Mint(signed_payload);
}

#include "bridge/bridge_token_operations.hpp"
#include "signature/typed_data_signer.hpp"
#include "signature/voucher_codec.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

using json = nlohmann::json;

namespace {
  std::vector<std::string> QuantityAndAddress(const std::string& quantity, const std::optional<std::string>& address) {
    std::vector<std::string> args = {quantity};
    if (address) args.push_back(*address);
    return args;
  }
}

BridgeTokenOperations::BridgeTokenOperations(std::string contract, BridgeTransport& bridge, WalletContext& wallet)
  : contract_(std::move(contract)), bridge_(bridge), wallet_(wallet) {}

std::string BridgeTokenOperations::Route(const std::string& op) const {
  return contract_ + "/erc20/" + op;
}

json BridgeTokenOperations::Invoke(const std::string& op, const std::vector<std::string>& args) {
  return bridge_.Invoke(Route(op), args);
}

Token::Currency BridgeTokenOperations::Get() {
  return Invoke("get").get<Token::Currency>();
}

Token::CurrencyValue BridgeTokenOperations::Balance() {
  return Invoke("balance").get<Token::CurrencyValue>();
}

Token::CurrencyValue BridgeTokenOperations::BalanceOf(const std::string& address) {
  return Invoke("balanceOf", {address}).get<Token::CurrencyValue>();
}

Token::CurrencyValue BridgeTokenOperations::Allowance(const std::string& spender) {
  return Invoke("allowance", {spender}).get<Token::CurrencyValue>();
}

Token::CurrencyValue BridgeTokenOperations::AllowanceOf(const std::string& owner, const std::string& spender) {
  return Invoke("allowanceOf", {owner, spender}).get<Token::CurrencyValue>();
}

Token::CurrencyValue BridgeTokenOperations::TotalSupply() {
  return Invoke("totalSupply").get<Token::CurrencyValue>();
}

Token::TransactionResult BridgeTokenOperations::SetAllowance(const std::string& spender, const std::string& amount) {
  return Invoke("setAllowance", {spender, amount}).get<Token::TransactionResult>();
}

Token::TransactionResult BridgeTokenOperations::Transfer(const std::string& to, const std::string& amount) {
  return Invoke("transfer", {to, amount}).get<Token::TransactionResult>();
}

Token::TransactionResult BridgeTokenOperations::TransferFrom(const std::string& from, const std::string& to, const std::string& amount) {
  return Invoke("transferFrom", {from, to, amount}).get<Token::TransactionResult>();
}

Token::TransactionResult BridgeTokenOperations::Burn(const std::string& amount) {
  return Invoke("burn", {amount}).get<Token::TransactionResult>();
}

Token::TransactionResult BridgeTokenOperations::Claim(const std::string& amount) {
  return Invoke("claim", {amount}).get<Token::TransactionResult>();
}

Token::TransactionResult BridgeTokenOperations::ClaimTo(const std::string& address, const std::string& amount) {
  return Invoke("claimTo", {address, amount}).get<Token::TransactionResult>();
}

Token::TransactionResult BridgeTokenOperations::Mint(const std::string& amount) {
  return Invoke("mint", {amount}).get<Token::TransactionResult>();
}

Token::TransactionResult BridgeTokenOperations::MintTo(const std::string& address, const std::string& amount) {
  return Invoke("mintTo", {address, amount}).get<Token::TransactionResult>();
}

Token::ClaimCondition BridgeTokenOperations::GetActiveClaimCondition() {
  return Invoke("claimConditions/getActive").get<Token::ClaimCondition>();
}

bool BridgeTokenOperations::CanClaim(const std::string& quantity, const std::optional<std::string>& address) {
  return Invoke("claimConditions/canClaim", QuantityAndAddress(quantity, address)).get<bool>();
}

std::vector<std::string> BridgeTokenOperations::GetClaimIneligibilityReasons(const std::string& quantity,
                                                                             const std::optional<std::string>& address) {
  return Invoke("claimConditions/getClaimIneligibilityReasons", QuantityAndAddress(quantity, address))
    .get<std::vector<std::string>>();
}

Token::ClaimerProofs BridgeTokenOperations::GetClaimerProofs(const std::string&) {
  throw UnsupportedOperation("merkle allowlist proofs are not supported");
}

Token::SignedPayload BridgeTokenOperations::GenerateSignature(const Token::MintPayload& payload,
                                                              const std::optional<std::string>& private_key) {
  auto signed_payload = Invoke("signature/generate", {json(payload).dump()}).get<Token::SignedPayload>();
  if (!private_key || private_key->empty()) return signed_payload;

  EIP712::Domain domain;
  domain.name = bridge_.Invoke(contract_ + "/read", {"name"}).get<std::string>();
  domain.chain_id = wallet_.ChainId();
  domain.verifying_contract = contract_;
  auto req = VoucherCodec::BuildMintRequest(payload, signed_payload.payload.primary_sale_recipient);
  Logger::Info("re-signing bridge voucher for " + contract_ + " with explicit key");
  return TypedDataSigner::SignRequest(req, domain, *private_key);
}

bool BridgeTokenOperations::VerifySignature(const Token::SignedPayload& signed_payload) {
  return Invoke("signature/verify", {json(signed_payload).dump()}).get<bool>();
}

Token::TransactionResult BridgeTokenOperations::MintWithSignature(const Token::SignedPayload& signed_payload) {
  return Invoke("signature/mint", {json(signed_payload).dump()}).get<Token::TransactionResult>();
}

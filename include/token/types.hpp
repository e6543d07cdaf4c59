#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "numeric/big_int.hpp"

namespace Token {
  constexpr const char* kZeroAddress = "0x0000000000000000000000000000000000000000";
  // Sentinel the drop and token contracts use for the chain's native currency
  constexpr const char* kNativeTokenAddress = "0xEeeeeEeeeEeEeeEeEeEeeEEEeeeeEeeeeeeeEEeE";

  bool IsNativeToken(const std::string& currency_address);

  struct Currency {
    std::string name;
    std::string symbol;
    int decimals = 18;
  };

  struct CurrencyValue {
    std::string name;
    std::string symbol;
    int decimals = 18;
    std::string value;          // exact base units
    std::string display_value;  // value / 10^decimals, truncated
  };

  // Base-unit value rendered with the default display precision and separators
  CurrencyValue MakeCurrencyValue(const Currency& c, const BigInt& raw);

  struct ClaimCondition {
    std::string available_supply;
    std::string current_mint_supply;
    std::string max_claimable_supply;
    std::string max_claimable_per_wallet;
    std::string currency_address;
    CurrencyValue currency_metadata;  // price per token
    std::string start_timestamp;
    std::string merkle_root;
  };

  // Allowlist entry of one claimer
  struct ClaimerProofs {
    std::string address;
    std::vector<std::string> proof;
    std::string max_claimable;
    std::string price;
    std::string currency_address;
  };

  // Human-facing mint voucher; quantity and price are decimal amounts
  struct MintPayload {
    std::string to;
    std::string quantity;
    std::string price = "0";
    std::string currency_address = kZeroAddress;
    std::string primary_sale_recipient = kZeroAddress;
    std::string uid;  // 0x + 64 hex
    long long mint_start_time = 0;
    long long mint_end_time = 0;
  };

  // Signed voucher body; quantity and price are 18-decimal base-unit integers
  struct SignedPayloadOutput {
    std::string to;
    std::string quantity;
    std::string price;
    std::string currency_address;
    std::string primary_sale_recipient;
    std::string uid;
    long long mint_start_time = 0;
    long long mint_end_time = 0;
  };

  struct SignedPayload {
    std::string signature;  // 0x + 130 hex (r || s || v)
    SignedPayloadOutput payload;
  };

  // Mirror of the on-chain TokenERC20 MintRequest struct, in declaration order
  struct MintRequest {
    std::string to;
    std::string primary_sale_recipient;
    BigInt quantity = 0;
    BigInt price = 0;
    std::string currency;
    BigInt validity_start_timestamp = 0;
    BigInt validity_end_timestamp = 0;
    std::vector<unsigned char> uid;  // 32 bytes
  };

  enum class TransactionStatus { Pending, Submitted, Confirmed, Reverted, Failed };
  std::string ToString(TransactionStatus s);

  struct TransactionResult {
    TransactionStatus status = TransactionStatus::Pending;
    std::string tx_hash;
    std::string receipt;  // raw receipt JSON, empty until mined
  };

  void to_json(nlohmann::json& j, const Currency& c);
  void from_json(const nlohmann::json& j, Currency& c);
  void to_json(nlohmann::json& j, const CurrencyValue& c);
  void from_json(const nlohmann::json& j, CurrencyValue& c);
  void to_json(nlohmann::json& j, const ClaimCondition& c);
  void from_json(const nlohmann::json& j, ClaimCondition& c);
  void to_json(nlohmann::json& j, const MintPayload& p);
  void from_json(const nlohmann::json& j, MintPayload& p);
  void to_json(nlohmann::json& j, const SignedPayloadOutput& p);
  void from_json(const nlohmann::json& j, SignedPayloadOutput& p);
  void to_json(nlohmann::json& j, const SignedPayload& p);
  void from_json(const nlohmann::json& j, SignedPayload& p);
  void to_json(nlohmann::json& j, const TransactionResult& r);
  void from_json(const nlohmann::json& j, TransactionResult& r);
}

#include "token/types.hpp"
#include "numeric/decimal_converter.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include "utils/parse.hpp"

using json = nlohmann::json;

namespace {
  // The bridge serializes numbers as strings or as JSON numbers depending on the field
  std::string AsString(const json& j, const char* key, const std::string& def = std::string()) {
    if (!j.contains(key) || j[key].is_null()) return def;
    const auto& v = j[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_unsigned()) return std::to_string(v.get<unsigned long long>());
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return v.dump();
  }

  long long AsInt64(const json& j, const char* key, long long def = 0) {
    if (!j.contains(key) || j[key].is_null()) return def;
    const auto& v = j[key];
    if (v.is_number_integer()) return v.get<long long>();
    long long out = 0;
    if (v.is_string() && ParseInt64(v.get<std::string>(), out)) return out;
    throw ParseError(std::string("field '") + key + "' is not an integer");
  }

  // Receipts carry status as 1/0 or as a hex quantity ("0x1")
  bool ReceiptSucceeded(const json& receipt) {
    const auto& v = receipt["status"];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number_integer()) return v.get<long long>() == 1;
    if (v.is_string()) return BigInts::FromHex(v.get<std::string>()) == 1;
    return false;
  }

  json ReceiptToJson(const std::string& receipt) {
    if (receipt.empty()) return json();
    return json::parse(receipt);
  }
}

namespace Token {
  bool IsNativeToken(const std::string& currency_address) {
    return SameAddress(currency_address, kNativeTokenAddress);
  }

  CurrencyValue MakeCurrencyValue(const Currency& c, const BigInt& raw) {
    CurrencyValue v;
    v.name = c.name;
    v.symbol = c.symbol;
    v.decimals = c.decimals;
    v.value = raw.str();
    v.display_value = DecimalConverter::Format(raw, c.decimals, DecimalConverter::kDisplayDecimals, true);
    return v;
  }

  std::string ToString(TransactionStatus s) {
    switch (s) {
      case TransactionStatus::Pending: return "pending";
      case TransactionStatus::Submitted: return "submitted";
      case TransactionStatus::Confirmed: return "confirmed";
      case TransactionStatus::Reverted: return "reverted";
      case TransactionStatus::Failed: return "failed";
    }
    return "unknown";
  }

  static TransactionStatus StatusFromString(const std::string& s) {
    if (s == "pending") return TransactionStatus::Pending;
    if (s == "submitted") return TransactionStatus::Submitted;
    if (s == "confirmed") return TransactionStatus::Confirmed;
    if (s == "reverted") return TransactionStatus::Reverted;
    if (s == "failed") return TransactionStatus::Failed;
    throw ParseError("unknown transaction status '" + s + "'");
  }

  void to_json(json& j, const Currency& c) {
    j = json{{"name", c.name}, {"symbol", c.symbol}, {"decimals", std::to_string(c.decimals)}};
  }

  void from_json(const json& j, Currency& c) {
    c.name = AsString(j, "name");
    c.symbol = AsString(j, "symbol");
    c.decimals = static_cast<int>(AsInt64(j, "decimals", 18));
  }

  void to_json(json& j, const CurrencyValue& c) {
    j = json{{"name", c.name}, {"symbol", c.symbol}, {"decimals", std::to_string(c.decimals)},
             {"value", c.value}, {"displayValue", c.display_value}};
  }

  void from_json(const json& j, CurrencyValue& c) {
    c.name = AsString(j, "name");
    c.symbol = AsString(j, "symbol");
    c.decimals = static_cast<int>(AsInt64(j, "decimals", 18));
    c.value = AsString(j, "value", "0");
    c.display_value = AsString(j, "displayValue");
  }

  void to_json(json& j, const ClaimCondition& c) {
    j = json{{"availableSupply", c.available_supply},
             {"currentMintSupply", c.current_mint_supply},
             {"maxClaimableSupply", c.max_claimable_supply},
             {"maxClaimablePerWallet", c.max_claimable_per_wallet},
             {"currencyAddress", c.currency_address},
             {"currencyMetadata", c.currency_metadata},
             {"startTimestamp", c.start_timestamp},
             {"merkleRoot", c.merkle_root}};
  }

  void from_json(const json& j, ClaimCondition& c) {
    c.available_supply = AsString(j, "availableSupply");
    c.current_mint_supply = AsString(j, "currentMintSupply");
    c.max_claimable_supply = AsString(j, "maxClaimableSupply");
    c.max_claimable_per_wallet = AsString(j, "maxClaimablePerWallet");
    c.currency_address = AsString(j, "currencyAddress");
    if (j.contains("currencyMetadata") && j["currencyMetadata"].is_object())
      c.currency_metadata = j["currencyMetadata"].get<CurrencyValue>();
    c.start_timestamp = AsString(j, "startTimestamp");
    c.merkle_root = AsString(j, "merkleRoot");
  }

  void to_json(json& j, const MintPayload& p) {
    j = json{{"to", p.to}, {"quantity", p.quantity}, {"price", p.price},
             {"currencyAddress", p.currency_address}, {"primarySaleRecipient", p.primary_sale_recipient},
             {"uid", p.uid}, {"mintStartTime", p.mint_start_time}, {"mintEndTime", p.mint_end_time}};
  }

  void from_json(const json& j, MintPayload& p) {
    p.to = AsString(j, "to");
    p.quantity = AsString(j, "quantity");
    p.price = AsString(j, "price", "0");
    p.currency_address = AsString(j, "currencyAddress", kZeroAddress);
    p.primary_sale_recipient = AsString(j, "primarySaleRecipient", kZeroAddress);
    p.uid = AsString(j, "uid");
    p.mint_start_time = AsInt64(j, "mintStartTime");
    p.mint_end_time = AsInt64(j, "mintEndTime");
  }

  void to_json(json& j, const SignedPayloadOutput& p) {
    j = json{{"to", p.to}, {"quantity", p.quantity}, {"price", p.price},
             {"currencyAddress", p.currency_address}, {"primarySaleRecipient", p.primary_sale_recipient},
             {"uid", p.uid}, {"mintStartTime", p.mint_start_time}, {"mintEndTime", p.mint_end_time}};
  }

  void from_json(const json& j, SignedPayloadOutput& p) {
    p.to = AsString(j, "to");
    p.quantity = AsString(j, "quantity");
    p.price = AsString(j, "price", "0");
    p.currency_address = AsString(j, "currencyAddress", kZeroAddress);
    p.primary_sale_recipient = AsString(j, "primarySaleRecipient", kZeroAddress);
    p.uid = AsString(j, "uid");
    p.mint_start_time = AsInt64(j, "mintStartTime");
    p.mint_end_time = AsInt64(j, "mintEndTime");
  }

  void to_json(json& j, const SignedPayload& p) {
    j = json{{"signature", p.signature}, {"payload", p.payload}};
  }

  void from_json(const json& j, SignedPayload& p) {
    p.signature = AsString(j, "signature");
    if (!j.contains("payload") || !j["payload"].is_object()) throw ParseError("signed payload without 'payload' object");
    p.payload = j["payload"].get<SignedPayloadOutput>();
  }

  void to_json(json& j, const TransactionResult& r) {
    j = json{{"status", ToString(r.status)}, {"hash", r.tx_hash}, {"receipt", ReceiptToJson(r.receipt)}};
  }

  // Accepts both this library's shape and the bridge's {receipt, id} shape
  void from_json(const json& j, TransactionResult& r) {
    const json* receipt = j.contains("receipt") && j["receipt"].is_object() ? &j["receipt"] : nullptr;
    r.receipt = receipt ? receipt->dump() : std::string();
    r.tx_hash = AsString(j, "hash");
    if (r.tx_hash.empty() && receipt) r.tx_hash = AsString(*receipt, "transactionHash");
    if (j.contains("status") && j["status"].is_string()) {
      r.status = StatusFromString(j["status"].get<std::string>());
    } else if (receipt && receipt->contains("status")) {
      r.status = ReceiptSucceeded(*receipt) ? TransactionStatus::Confirmed : TransactionStatus::Reverted;
    } else {
      r.status = r.tx_hash.empty() ? TransactionStatus::Pending : TransactionStatus::Submitted;
    }
  }
}

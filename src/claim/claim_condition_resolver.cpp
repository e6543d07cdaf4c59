#include "claim/claim_condition_resolver.hpp"
#include "protocols/drop_erc20.hpp"
#include "protocols/erc20.hpp"
#include "numeric/decimal_converter.hpp"
#include "token/contract_io.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"

ClaimConditionResolver::ClaimConditionResolver(ContractReader& reader) : reader_(reader) {}

Token::Currency ClaimConditionResolver::FetchCurrency(const std::string& currency_address) {
  try {
    return ERC20::GetCurrency(reader_, currency_address);
  } catch (const std::exception& e) {
    throw MetadataUnavailable(currency_address + ": " + e.what());
  }
}

Token::ClaimCondition ClaimConditionResolver::GetActive(const std::string& contract) {
  BigInt id = DropERC20::ActiveClaimConditionId(reader_, contract);
  auto data = DropERC20::ClaimConditionById(reader_, contract, id);

  Token::Currency currency;
  try {
    currency = FetchCurrency(data.currency);
  } catch (const MetadataUnavailable& e) {
    Logger::Warning(std::string("Could not fetch currency metadata, proceeding without it: ") + e.what());
    currency = Token::Currency{};
  }

  Token::ClaimCondition c;
  BigInt available = data.max_claimable_supply > data.supply_claimed
                       ? BigInt(data.max_claimable_supply - data.supply_claimed) : BigInt(0);
  c.available_supply = BigInts::ToDecimalString(available);
  c.current_mint_supply = BigInts::ToDecimalString(data.supply_claimed);
  c.max_claimable_supply = BigInts::ToDecimalString(data.max_claimable_supply);
  c.max_claimable_per_wallet = BigInts::ToDecimalString(data.quantity_limit_per_wallet);
  c.currency_address = data.currency;
  c.currency_metadata = Token::MakeCurrencyValue(currency, data.price_per_token);
  c.start_timestamp = BigInts::ToDecimalString(data.start_timestamp);
  c.merkle_root = BytesToHex0x(data.merkle_root);
  Logger::Debug("active claim condition " + BigInts::ToDecimalString(id) + " on " + contract +
                " available=" + c.available_supply);
  return c;
}

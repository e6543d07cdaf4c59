#pragma once
#include <string>
#include "token/types.hpp"

class ContractReader;

// Reads the active claim condition of a drop contract and prices it in its currency.
class ClaimConditionResolver {
public:
  explicit ClaimConditionResolver(ContractReader& reader);

  // Currency metadata failures are logged and replaced by the empty currency
  Token::ClaimCondition GetActive(const std::string& contract);

private:
  ContractReader& reader_;

  // Throws MetadataUnavailable
  Token::Currency FetchCurrency(const std::string& currency_address);
};

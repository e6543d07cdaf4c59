#pragma once
#include <string>
#include "numeric/big_int.hpp"
#include "token/types.hpp"

class ContractReader;

// Standard ERC20 views and calldata builders. Read failures propagate.
namespace ERC20 {
  int Decimals(ContractReader& reader, const std::string& token);
  std::string Name(ContractReader& reader, const std::string& token);
  std::string Symbol(ContractReader& reader, const std::string& token);
  BigInt TotalSupply(ContractReader& reader, const std::string& token);
  BigInt BalanceOf(ContractReader& reader, const std::string& token, const std::string& owner);
  BigInt Allowance(ContractReader& reader, const std::string& token, const std::string& owner, const std::string& spender);
  // name + symbol + decimals snapshot
  Token::Currency GetCurrency(ContractReader& reader, const std::string& token);

  std::string ApproveCall(const std::string& spender, const BigInt& amount);
  std::string TransferCall(const std::string& to, const BigInt& amount);
  std::string TransferFromCall(const std::string& from, const std::string& to, const BigInt& amount);
  // ERC20Burnable / TokenERC20 extensions
  std::string BurnCall(const BigInt& amount);
  std::string MintToCall(const std::string& to, const BigInt& amount);
}

#include "protocols/erc20.hpp"
#include "encoding/abi.hpp"
#include "token/contract_io.hpp"
#include "utils/hex.hpp"
#include <stdexcept>
#include <string>

// Older tokens (MKR, SAI) return name/symbol as bytes32 rather than string
static std::string DecodeStringOrBytes32(const std::string& result) {
  ABI::Reader r(result);
  if (r.WordCount() == 1) {
    auto b = r.Bytes32(0);
    std::string s(b.begin(), b.end());
    return s.substr(0, s.find('\0'));
  }
  return r.String(0);
}

namespace ERC20 {
  int Decimals(ContractReader& reader, const std::string& token) {
    auto res = reader.Call(token, ABI::EncodeCall("decimals()", {}));
    BigInt d = ABI::Reader(res).Uint(0);
    if (d > 255) throw std::runtime_error("decimals() out of range for " + token);
    return static_cast<int>(d);
  }

  std::string Name(ContractReader& reader, const std::string& token) {
    return DecodeStringOrBytes32(reader.Call(token, ABI::EncodeCall("name()", {})));
  }

  std::string Symbol(ContractReader& reader, const std::string& token) {
    return DecodeStringOrBytes32(reader.Call(token, ABI::EncodeCall("symbol()", {})));
  }

  BigInt TotalSupply(ContractReader& reader, const std::string& token) {
    return ABI::Reader(reader.Call(token, ABI::EncodeCall("totalSupply()", {}))).Uint(0);
  }

  BigInt BalanceOf(ContractReader& reader, const std::string& token, const std::string& owner) {
    auto data = ABI::EncodeCall("balanceOf(address)", {ABI::Static(ABI::EncodeAddress(owner))});
    return ABI::Reader(reader.Call(token, data)).Uint(0);
  }

  BigInt Allowance(ContractReader& reader, const std::string& token, const std::string& owner, const std::string& spender) {
    auto data = ABI::EncodeCall("allowance(address,address)", {
      ABI::Static(ABI::EncodeAddress(owner)),
      ABI::Static(ABI::EncodeAddress(spender))
    });
    return ABI::Reader(reader.Call(token, data)).Uint(0);
  }

  Token::Currency GetCurrency(ContractReader& reader, const std::string& token) {
    Token::Currency c;
    c.decimals = Decimals(reader, token);
    c.name = Name(reader, token);
    c.symbol = Symbol(reader, token);
    return c;
  }

  std::string ApproveCall(const std::string& spender, const BigInt& amount) {
    return ABI::EncodeCall("approve(address,uint256)", {
      ABI::Static(ABI::EncodeAddress(spender)),
      ABI::Static(ABI::EncodeUint(amount))
    });
  }

  std::string TransferCall(const std::string& to, const BigInt& amount) {
    return ABI::EncodeCall("transfer(address,uint256)", {
      ABI::Static(ABI::EncodeAddress(to)),
      ABI::Static(ABI::EncodeUint(amount))
    });
  }

  std::string TransferFromCall(const std::string& from, const std::string& to, const BigInt& amount) {
    return ABI::EncodeCall("transferFrom(address,address,uint256)", {
      ABI::Static(ABI::EncodeAddress(from)),
      ABI::Static(ABI::EncodeAddress(to)),
      ABI::Static(ABI::EncodeUint(amount))
    });
  }

  std::string BurnCall(const BigInt& amount) {
    return ABI::EncodeCall("burn(uint256)", {ABI::Static(ABI::EncodeUint(amount))});
  }

  std::string MintToCall(const std::string& to, const BigInt& amount) {
    return ABI::EncodeCall("mintTo(address,uint256)", {
      ABI::Static(ABI::EncodeAddress(to)),
      ABI::Static(ABI::EncodeUint(amount))
    });
  }
}

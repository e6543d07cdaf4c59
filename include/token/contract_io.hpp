#pragma once
#include <string>
#include <vector>
#include "crypto/secp256k1.hpp"
#include "numeric/big_int.hpp"
#include "token/types.hpp"

// Read-only contract access: returns the 0x-hex ABI-encoded return data.
class ContractReader {
public:
  virtual ~ContractReader() = default;
  virtual std::string Call(const std::string& address, const std::string& calldata) = 0;
};

// State-changing contract access. Returns the transaction outcome or throws
// TransactionFailed; never retries.
class ContractWriter {
public:
  virtual ~ContractWriter() = default;
  virtual Token::TransactionResult Write(const std::string& address,
                                         const std::string& calldata,
                                         const BigInt& native_value) = 0;
};

// The connected wallet, owned by the host application.
class WalletContext {
public:
  virtual ~WalletContext() = default;
  virtual std::string Address() = 0;
  virtual long long ChainId() = 0;
  // Ambient signer used when no explicit key is supplied
  virtual Crypto::Signature SignDigest(const std::vector<unsigned char>& digest32) = 0;
};

#pragma once
#include <string>
#include "token/contract_io.hpp"

class RpcClient;
class Signer;
class NonceManager;
class GasStrategy;

class RpcContractReader : public ContractReader {
public:
  explicit RpcContractReader(RpcClient& rpc) : rpc_(rpc) {}
  std::string Call(const std::string& address, const std::string& calldata) override;
private:
  RpcClient& rpc_;
};

struct WriterOptions {
  long long chain_id = 1;
  int receipt_timeout_ms = 60000;
  int receipt_poll_ms = 1000;
  // Estimated gas is scaled by (100 + pct) / 100
  int gas_limit_buffer_pct = 20;
};

// Estimates gas, signs an EIP-1559 transaction and polls for its receipt.
// A receipt that does not show up within receipt_timeout_ms leaves the
// result in the Submitted state.
class RpcContractWriter : public ContractWriter {
public:
  RpcContractWriter(RpcClient& rpc, Signer& signer, NonceManager& nonce, GasStrategy& gas, const WriterOptions& opts);
  Token::TransactionResult Write(const std::string& address,
                                 const std::string& calldata,
                                 const BigInt& native_value) override;
private:
  RpcClient& rpc_;
  Signer& signer_;
  NonceManager& nonce_;
  GasStrategy& gas_;
  WriterOptions opts_;
  bool WaitForReceipt(Token::TransactionResult& result);
};

class SignerWalletContext : public WalletContext {
public:
  SignerWalletContext(Signer& signer, long long chain_id) : signer_(signer), chain_id_(chain_id) {}
  std::string Address() override;
  long long ChainId() override { return chain_id_; }
  Crypto::Signature SignDigest(const std::vector<unsigned char>& digest32) override;
private:
  Signer& signer_;
  long long chain_id_;
};

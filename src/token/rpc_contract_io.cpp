#include "token/rpc_contract_io.hpp"
#include "node_connection/rpc_client.hpp"
#include "wallet/signer.hpp"
#include "wallet/nonce_manager.hpp"
#include "gas/gas_strategy.hpp"
#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include "common/errors.hpp"
#include <chrono>
#include <thread>
#include <nlohmann/json.hpp>

std::string RpcContractReader::Call(const std::string& address, const std::string& calldata) {
  return rpc_.EthCall(address, calldata);
}

RpcContractWriter::RpcContractWriter(RpcClient& rpc, Signer& signer, NonceManager& nonce, GasStrategy& gas, const WriterOptions& opts)
  : rpc_(rpc), signer_(signer), nonce_(nonce), gas_(gas), opts_(opts) {}

Token::TransactionResult RpcContractWriter::Write(const std::string& address,
                                                  const std::string& calldata,
                                                  const BigInt& native_value) {
  Token::TransactionResult result;
  TransactionFields tx;
  tx.chain_id = opts_.chain_id;
  tx.to = address;
  tx.value = native_value;
  tx.data = calldata;
  try {
    auto estimate = BigInts::FromHex(rpc_.EthEstimateGas(signer_.Address(), address, calldata, BigInts::ToHexQuantity(native_value)));
    tx.gas_limit = static_cast<unsigned long long>(estimate * (100 + opts_.gas_limit_buffer_pct) / 100);
    auto gq = gas_.Quote();
    tx.max_fee_per_gas = gq.max_fee_per_gas;
    tx.max_priority_fee_per_gas = gq.max_priority_fee_per_gas;
  } catch (const std::exception& e) {
    Logger::Error(std::string("transaction preparation failed: ") + e.what());
    StructuredLogger::Instance().LogEvent("tx_failed", {{"to", address}, {"stage", "prepare"}, {"error", e.what()}});
    throw TransactionFailed(e.what());
  }

  tx.nonce = nonce_.Next();
  try {
    result.tx_hash = rpc_.EthSendRawTransaction(signer_.SignEip1559(tx));
  } catch (const std::exception& e) {
    // nothing was broadcast, so the nonce can be handed out again
    nonce_.Release(tx.nonce);
    Logger::Error(std::string("eth_sendRawTransaction failed: ") + e.what());
    StructuredLogger::Instance().LogEvent("tx_failed", {{"to", address}, {"stage", "submit"}, {"nonce", tx.nonce}, {"error", e.what()}});
    throw TransactionFailed(e.what());
  }
  result.status = Token::TransactionStatus::Submitted;
  Logger::Info("submitted " + result.tx_hash + " to " + address + " nonce=" + std::to_string(tx.nonce));
  StructuredLogger::Instance().LogEvent("tx_submitted", {
    {"tx_hash", result.tx_hash}, {"to", address}, {"nonce", tx.nonce},
    {"value", native_value.str()}, {"gas_limit", tx.gas_limit},
    {"max_fee_per_gas", tx.max_fee_per_gas}, {"max_priority_fee", tx.max_priority_fee_per_gas}});

  if (!WaitForReceipt(result)) {
    Logger::Warning("no receipt for " + result.tx_hash + " after " + std::to_string(opts_.receipt_timeout_ms) + "ms");
  }
  return result;
}

bool RpcContractWriter::WaitForReceipt(Token::TransactionResult& result) {
  auto start = std::chrono::steady_clock::now();
  while (std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count() < opts_.receipt_timeout_ms) {
    try {
      auto receipt = rpc_.EthGetTransactionReceipt(result.tx_hash);
      if (receipt.is_object()) {
        bool ok = receipt.contains("status") && receipt["status"].is_string() &&
                  BigInts::FromHex(receipt["status"].get<std::string>()) == 1;
        result.status = ok ? Token::TransactionStatus::Confirmed : Token::TransactionStatus::Reverted;
        result.receipt = receipt.dump();
        StructuredLogger::Instance().LogEvent("tx_receipt", {{"tx_hash", result.tx_hash}, {"status", Token::ToString(result.status)}});
        if (!ok) Logger::Warning("transaction reverted: " + result.tx_hash);
        return true;
      }
    } catch (const std::exception& e) {
      // the transaction is already broadcast; keep polling through transient RPC errors
      Logger::Warning(std::string("receipt poll failed: ") + e.what());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(opts_.receipt_poll_ms));
  }
  return false;
}

std::string SignerWalletContext::Address() {
  return signer_.Address();
}

Crypto::Signature SignerWalletContext::SignDigest(const std::vector<unsigned char>& digest32) {
  return signer_.SignDigest(digest32);
}

#pragma once
#include <string>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

class HttpClient;

class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt);
  // Sends raw JSON-RPC payload to the endpoint.
  std::string Send(const std::string& json_payload, int timeout_ms = 3000);

  // Each helper returns the "result" member (string results unquoted) and
  // throws std::runtime_error on transport or JSON-RPC errors.
  std::string EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block = std::nullopt, int timeout_ms = 3000);
  std::string EthEstimateGas(const std::string& from, const std::string& to, const std::string& data, const std::string& value_hex, int timeout_ms = 3000);
  std::string EthSendRawTransaction(const std::string& raw_tx_hex, int timeout_ms = 5000);
  // Receipt object, or null until the transaction is mined
  nlohmann::json EthGetTransactionReceipt(const std::string& tx_hash, int timeout_ms = 5000);
  std::string EthGetTransactionCount(const std::string& address, const std::string& block_tag = "pending", int timeout_ms = 3000);
  nlohmann::json EthGetBlockByNumber(const std::string& tag_or_hex, bool full_tx = false, int timeout_ms = 3000);
  std::string EthMaxPriorityFeePerGas(int timeout_ms = 3000);
  std::string EthChainId(int timeout_ms = 3000);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  std::optional<std::string> auth_header_;
  std::unordered_map<std::string, std::string> default_headers_;
  std::string BuildPayload(const std::string& method, const nlohmann::json& params);
  nlohmann::json CallJson(const std::string& method, const nlohmann::json& params, int timeout_ms);
  std::string Call(const std::string& method, const nlohmann::json& params, int timeout_ms);
};

#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <cctype>
#include <stdexcept>
#include <string>
#include <unordered_map>

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header)
  : http_(http), endpoint_(endpoint_url), auth_header_(auth_header) {
  default_headers_.reserve(2);
  default_headers_["Content-Type"] = "application/json";
  if (auth_header_) {
    ApplyAuthHeader(default_headers_, auth_header_);
  }
}

std::string RpcClient::BuildPayload(const std::string& method, const nlohmann::json& params) {
  nlohmann::json body = {
    {"jsonrpc", "2.0"},
    {"method", method},
    {"params", params},
    {"id", 1}
  };
  return body.dump();
}

std::string RpcClient::Send(const std::string& json_payload, int timeout_ms) {
  auto resp = http_.Post(endpoint_, json_payload, default_headers_, timeout_ms);
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("HTTP POST failed status=" + std::to_string(resp.status));
    throw std::runtime_error("HTTP POST failed with status " + std::to_string(resp.status));
  }
  return resp.body;
}

nlohmann::json RpcClient::CallJson(const std::string& method, const nlohmann::json& params, int timeout_ms) {
  auto body = nlohmann::json::parse(Send(BuildPayload(method, params), timeout_ms), nullptr, false);
  if (body.is_discarded()) throw std::runtime_error(method + ": node returned invalid JSON");
  if (body.contains("error") && !body["error"].is_null()) {
    const auto& err = body["error"];
    if (err.is_object() && err.contains("message") && err["message"].is_string())
      throw std::runtime_error(err["message"].get<std::string>());
    throw std::runtime_error(err.dump());
  }
  if (!body.contains("result")) throw std::runtime_error(method + ": missing result");
  return body["result"];
}

std::string RpcClient::Call(const std::string& method, const nlohmann::json& params, int timeout_ms) {
  auto result = CallJson(method, params, timeout_ms);
  if (!result.is_string()) throw std::runtime_error(method + ": expected a string result, got " + result.dump());
  return result.get<std::string>();
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block, int timeout_ms) {
  nlohmann::json call = {{"to", to}, {"data", data}};
  return Call("eth_call", nlohmann::json::array({call, block.value_or("latest")}), timeout_ms);
}

std::string RpcClient::EthEstimateGas(const std::string& from, const std::string& to, const std::string& data, const std::string& value_hex, int timeout_ms) {
  nlohmann::json call = {{"from", from}, {"to", to}, {"data", data}, {"value", value_hex}};
  return Call("eth_estimateGas", nlohmann::json::array({call}), timeout_ms);
}

std::string RpcClient::EthSendRawTransaction(const std::string& raw_tx_hex, int timeout_ms) {
  return Call("eth_sendRawTransaction", nlohmann::json::array({raw_tx_hex}), timeout_ms);
}

nlohmann::json RpcClient::EthGetTransactionReceipt(const std::string& tx_hash, int timeout_ms) {
  return CallJson("eth_getTransactionReceipt", nlohmann::json::array({tx_hash}), timeout_ms);
}

std::string RpcClient::EthGetTransactionCount(const std::string& address, const std::string& block_tag, int timeout_ms) {
  return Call("eth_getTransactionCount", nlohmann::json::array({address, block_tag}), timeout_ms);
}

nlohmann::json RpcClient::EthGetBlockByNumber(const std::string& tag_or_hex, bool full_tx, int timeout_ms) {
  return CallJson("eth_getBlockByNumber", nlohmann::json::array({tag_or_hex, full_tx}), timeout_ms);
}

std::string RpcClient::EthMaxPriorityFeePerGas(int timeout_ms) {
  return Call("eth_maxPriorityFeePerGas", nlohmann::json::array(), timeout_ms);
}

std::string RpcClient::EthChainId(int timeout_ms) {
  return Call("eth_chainId", nlohmann::json::array(), timeout_ms);
}

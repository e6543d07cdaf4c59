#include "bridge/bridge_transport.hpp"
#include "net/http_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/parse.hpp"
#include <stdexcept>

using json = nlohmann::json;

HttpBridgeTransport::HttpBridgeTransport(HttpClient& http, std::string url, int timeout_ms)
  : http_(http), url_(std::move(url)), timeout_ms_(timeout_ms) {}

json HttpBridgeTransport::Invoke(const std::string& route, const std::vector<std::string>& args) {
  json body = {{"route", route}, {"arguments", args}};
  std::unordered_map<std::string, std::string> headers = {{"Content-Type", "application/json"}};
  Logger::Debug("bridge invoke " + route);
  auto resp = http_.Post(url_, body.dump(), headers, timeout_ms_);
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("bridge POST failed route=" + route + " status=" + std::to_string(resp.status));
    throw std::runtime_error("bridge POST failed with status " + std::to_string(resp.status));
  }
  json j = json::parse(resp.body, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("bridge returned invalid JSON for " + route);
  if (j.contains("error") && !j["error"].is_null()) {
    const auto& e = j["error"];
    std::string msg = e.is_object() && e.contains("message") ? e["message"].get<std::string>()
                    : e.is_string() ? e.get<std::string>() : e.dump();
    throw std::runtime_error("bridge error on " + route + ": " + msg);
  }
  if (!j.contains("result")) throw std::runtime_error("bridge response missing result for " + route);
  return j["result"];
}

BridgeWalletContext::BridgeWalletContext(BridgeTransport& bridge) : bridge_(bridge) {}

std::string BridgeWalletContext::Address() {
  return bridge_.Invoke("sdk/wallet/getAddress", {}).get<std::string>();
}

long long BridgeWalletContext::ChainId() {
  json r = bridge_.Invoke("sdk/wallet/getChainId", {});
  if (r.is_number_integer()) return r.get<long long>();
  if (r.is_string()) {
    long long id = 0;
    if (!ParseInt64(r.get<std::string>(), id, 0)) throw ParseError("bridge chain id '" + r.get<std::string>() + "'");
    return id;
  }
  throw ParseError("bridge chain id is not a number");
}

Crypto::Signature BridgeWalletContext::SignDigest(const std::vector<unsigned char>&) {
  throw UnsupportedOperation("local signing is unavailable on the bridge target; pass an explicit key");
}

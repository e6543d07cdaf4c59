#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "token/contract_io.hpp"

class HttpClient;

// Out-of-process bridge used on restricted runtime targets. Arguments are
// JSON-serialized individually (plain strings are passed through as-is).
class BridgeTransport {
public:
  virtual ~BridgeTransport() = default;
  // Returns the "result" member; throws std::runtime_error on transport or bridge errors
  virtual nlohmann::json Invoke(const std::string& route, const std::vector<std::string>& args) = 0;
};

// POSTs {"route": ..., "arguments": [...]} and expects {"result": ...} or {"error": ...}
class HttpBridgeTransport : public BridgeTransport {
public:
  HttpBridgeTransport(HttpClient& http, std::string url, int timeout_ms = 30000);
  nlohmann::json Invoke(const std::string& route, const std::vector<std::string>& args) override;
private:
  HttpClient& http_;
  std::string url_;
  int timeout_ms_;
};

// Wallet owned by the bridge host. It cannot sign locally.
class BridgeWalletContext : public WalletContext {
public:
  explicit BridgeWalletContext(BridgeTransport& bridge);
  std::string Address() override;
  long long ChainId() override;
  // Throws UnsupportedOperation
  Crypto::Signature SignDigest(const std::vector<unsigned char>& digest32) override;
private:
  BridgeTransport& bridge_;
};

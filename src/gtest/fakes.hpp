#pragma once
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "bridge/bridge_transport.hpp"
#include "net/http_client.hpp"
#include "token/contract_io.hpp"
#include "wallet/signer.hpp"

// Contract state keyed by (address, selector); unknown calls throw like a reverted eth_call.
class FakeReader : public ContractReader {
public:
  std::string Call(const std::string& address, const std::string& calldata) override;
  void Set(const std::string& address, const std::string& signature, const std::string& result_hex);
  // Every call to this address throws
  void Fail(const std::string& address) { failing_.insert(Key(address)); }
  // Calldata of every call seen, in order
  std::vector<std::pair<std::string, std::string>> calls;
private:
  std::map<std::pair<std::string, std::string>, std::string> results_;
  std::set<std::string> failing_;
  static std::string Key(const std::string& address);
};

class FakeWriter : public ContractWriter {
public:
  struct Sent { std::string address; std::string calldata; BigInt value; };
  Token::TransactionResult Write(const std::string& address, const std::string& calldata, const BigInt& native_value) override;
  std::vector<Sent> sent;
};

class FakeWallet : public WalletContext {
public:
  explicit FakeWallet(const std::string& private_key, long long chain_id = 137)
    : signer_(private_key), chain_id_(chain_id) {}
  std::string Address() override { return signer_.Address(); }
  long long ChainId() override { return chain_id_; }
  Crypto::Signature SignDigest(const std::vector<unsigned char>& digest32) override { return signer_.SignDigest(digest32); }
private:
  Signer signer_;
  long long chain_id_;
};

class FakeBridge : public BridgeTransport {
public:
  nlohmann::json Invoke(const std::string& route, const std::vector<std::string>& args) override;
  void Set(const std::string& route, nlohmann::json result) { results_[route] = std::move(result); }
  std::vector<std::pair<std::string, std::vector<std::string>>> calls;
private:
  std::map<std::string, nlohmann::json> results_;
};

// Answers every POST with handler(body); records requests in order.
class FakeHttpClient : public HttpClient {
public:
  struct Request { std::string url; std::string body; std::unordered_map<std::string, std::string> headers; };
  HttpResponse Post(const std::string& url, const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers, int timeout_ms) override;
  std::function<HttpResponse(const std::string&)> handler;
  std::vector<Request> requests;
};

// JSON-RPC node keyed by method name. Unknown methods answer with a JSON-RPC error.
class FakeNode {
public:
  explicit FakeNode(FakeHttpClient& http);
  void Result(const std::string& method, nlohmann::json result) { results_[method] = std::move(result); }
  void Error(const std::string& method, const std::string& message) { errors_[method] = message; }
  // Methods called, in order
  std::vector<std::string> methods;
  // params of the last call to each method
  std::map<std::string, nlohmann::json> params;
private:
  std::map<std::string, nlohmann::json> results_;
  std::map<std::string, std::string> errors_;
};

// ABI return-data helpers
namespace AbiResult {
  std::string Word(const BigInt& v);
  std::string Address(const std::string& addr);
  std::string String(const std::string& s);
  // Two-word (bool, address) tuple as returned by TokenERC20.verify
  std::string BoolAndAddress(bool ok, const std::string& addr);
  std::string ClaimCondition(const BigInt& start, const BigInt& max_supply, const BigInt& claimed,
                             const BigInt& per_wallet, const BigInt& price, const std::string& currency);
}

// Private key 1 and its well-known address
constexpr const char* kTestKey = "0x0000000000000000000000000000000000000000000000000000000000000001";
constexpr const char* kTestKeyAddress = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf";
constexpr const char* kTokenAddress = "0x1111111111111111111111111111111111111111";
constexpr const char* kCurrencyAddress = "0x2222222222222222222222222222222222222222";
constexpr const char* kReceiver = "0xabcabcabcabcabcabcabcabcabcabcabcabcabca";

#include "fakes.hpp"
#include "encoding/abi.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

std::string FakeReader::Key(const std::string& address) {
  return ToLowerHex(Ensure0x(address));
}

void FakeReader::Set(const std::string& address, const std::string& signature, const std::string& result_hex) {
  results_[{Key(address), ABI::Selector(signature)}] = result_hex;
}

std::string FakeReader::Call(const std::string& address, const std::string& calldata) {
  calls.emplace_back(address, calldata);
  if (failing_.count(Key(address))) throw std::runtime_error("execution reverted");
  auto it = results_.find({Key(address), calldata.substr(0, 10)});
  if (it == results_.end()) throw std::runtime_error("no fake result for " + address + " " + calldata.substr(0, 10));
  return it->second;
}

Token::TransactionResult FakeWriter::Write(const std::string& address, const std::string& calldata, const BigInt& native_value) {
  sent.push_back({address, calldata, native_value});
  Token::TransactionResult r;
  r.status = Token::TransactionStatus::Confirmed;
  r.tx_hash = "0x" + std::string(64, 'a');
  r.receipt = "{\"status\":\"0x1\"}";
  return r;
}

nlohmann::json FakeBridge::Invoke(const std::string& route, const std::vector<std::string>& args) {
  calls.emplace_back(route, args);
  auto it = results_.find(route);
  if (it == results_.end()) throw std::runtime_error("no fake bridge result for " + route);
  return it->second;
}

HttpResponse FakeHttpClient::Post(const std::string& url, const std::string& body,
                                  const std::unordered_map<std::string, std::string>& headers, int) {
  requests.push_back({url, body, headers});
  if (!handler) return HttpResponse{500, ""};
  return handler(body);
}

FakeNode::FakeNode(FakeHttpClient& http) {
  http.handler = [this](const std::string& body) {
    auto req = nlohmann::json::parse(body);
    std::string method = req["method"].get<std::string>();
    methods.push_back(method);
    params[method] = req["params"];
    nlohmann::json resp = {{"jsonrpc", "2.0"}, {"id", req["id"]}};
    auto err = errors_.find(method);
    auto it = results_.find(method);
    if (err != errors_.end()) {
      resp["error"] = {{"code", -32000}, {"message", err->second}};
    } else if (it != results_.end()) {
      resp["result"] = it->second;
    } else {
      resp["error"] = {{"code", -32601}, {"message", "method not found: " + method}};
    }
    return HttpResponse{200, resp.dump()};
  };
}

namespace AbiResult {
  std::string Word(const BigInt& v) {
    return BytesToHex0x(ABI::EncodeUint(v));
  }

  std::string Address(const std::string& addr) {
    return BytesToHex0x(ABI::EncodeAddress(addr));
  }

  std::string String(const std::string& s) {
    return BytesToHex0x(ABI::EncodeTuple({ABI::Dynamic(ABI::EncodeString(s))}));
  }

  std::string BoolAndAddress(bool ok, const std::string& addr) {
    return BytesToHex0x(ABI::EncodeTuple({ABI::Static(ABI::EncodeBool(ok)), ABI::Static(ABI::EncodeAddress(addr))}));
  }

  std::string ClaimCondition(const BigInt& start, const BigInt& max_supply, const BigInt& claimed,
                             const BigInt& per_wallet, const BigInt& price, const std::string& currency) {
    ABI::Bytes inner = ABI::EncodeTuple({
      ABI::Static(ABI::EncodeUint(start)),
      ABI::Static(ABI::EncodeUint(max_supply)),
      ABI::Static(ABI::EncodeUint(claimed)),
      ABI::Static(ABI::EncodeUint(per_wallet)),
      ABI::Static(ABI::EncodeBytes32(ABI::Bytes(32, 0))),
      ABI::Static(ABI::EncodeUint(price)),
      ABI::Static(ABI::EncodeAddress(currency)),
      ABI::Dynamic(ABI::EncodeString("ipfs://condition"))
    });
    return BytesToHex0x(ABI::EncodeTuple({ABI::Dynamic(inner)}));
  }
}

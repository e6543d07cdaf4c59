#pragma once
#include <atomic>
#include <mutex>
#include <string>

class RpcClient;

// Sequential nonces for one sender, seeded once from its pending transaction count.
class NonceManager {
public:
  NonceManager(RpcClient& rpc, const std::string& address);
  unsigned long long Next();
  // Hands `nonce` back when its transaction never reached the node. Only the
  // most recently issued nonce can be released; returns false otherwise.
  bool Release(unsigned long long nonce);
  const std::string& Address() const { return address_; }
private:
  RpcClient& rpc_;
  std::string address_;
  std::atomic<unsigned long long> next_{0};
  std::once_flag seeded_;
  void Seed();
};

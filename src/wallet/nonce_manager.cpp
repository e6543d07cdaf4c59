#include "wallet/nonce_manager.hpp"
#include "node_connection/rpc_client.hpp"
#include "numeric/big_int.hpp"
#include "common/logger.hpp"

NonceManager::NonceManager(RpcClient& rpc, const std::string& address) : rpc_(rpc), address_(address) {}

void NonceManager::Seed() {
  auto pending = static_cast<unsigned long long>(BigInts::FromHex(rpc_.EthGetTransactionCount(address_, "pending")));
  next_.store(pending);
  Logger::Debug("nonce for " + address_ + " seeded at " + std::to_string(pending));
}

unsigned long long NonceManager::Next() {
  std::call_once(seeded_, [this]{ Seed(); });
  return next_.fetch_add(1);
}

bool NonceManager::Release(unsigned long long nonce) {
  unsigned long long expected = nonce + 1;
  if (next_.compare_exchange_strong(expected, nonce)) return true;
  Logger::Warning("nonce " + std::to_string(nonce) + " not released, next is " + std::to_string(expected));
  return false;
}

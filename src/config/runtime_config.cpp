#include "config/runtime_config.hpp"
#include "common/config_manager.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

static RuntimeTarget ParseTarget(const std::string& s) {
  if (s == "native") return RuntimeTarget::Native;
  if (s == "bridge") return RuntimeTarget::Bridge;
  throw std::runtime_error("RUNTIME_TARGET must be 'native' or 'bridge', got '" + s + "'");
}

RuntimeConfig LoadRuntimeConfig() {
  RuntimeConfig cfg;
  cfg.target = ParseTarget(ConfigManager::Get("RUNTIME_TARGET").value_or("native"));
  cfg.rpc_timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", cfg.rpc_timeout_ms);
  cfg.receipt_timeout_ms = ConfigManager::GetIntOr("RECEIPT_TIMEOUT_MS", cfg.receipt_timeout_ms);
  cfg.receipt_poll_ms = ConfigManager::GetIntOr("RECEIPT_POLL_MS", cfg.receipt_poll_ms);
  if (auto k = ConfigManager::Get("PRIVATE_KEY")) cfg.private_key = *k;
  if (auto a = ConfigManager::Get("WALLET_ADDRESS")) cfg.wallet_address = *a;
  if (cfg.target == RuntimeTarget::Bridge) {
    cfg.bridge_url = ConfigManager::GetOrThrow("BRIDGE_URL");
    return cfg;
  }
  cfg.rpc_url = ConfigManager::GetOrThrow("RPC_URL");
  cfg.chain_id = ConfigManager::GetInt64Or("CHAIN_ID", cfg.chain_id);
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER")) cfg.auth_header = *a;
  return cfg;
}

void CheckWalletAddress(const RuntimeConfig& cfg, const std::string& key_address) {
  if (!cfg.wallet_address) return;
  if (!SameAddress(*cfg.wallet_address, key_address))
    throw std::runtime_error("WALLET_ADDRESS " + *cfg.wallet_address + " does not match PRIVATE_KEY address " + key_address);
}

std::string ToString(RuntimeTarget target) {
  return target == RuntimeTarget::Bridge ? "bridge" : "native";
}

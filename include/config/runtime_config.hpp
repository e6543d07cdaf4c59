#pragma once
#include <string>
#include <optional>

// Native: contract calls go over JSON-RPC from this process.
// Bridge: the host forbids direct RPC (restricted target); everything is
// forwarded to an out-of-process bridge.
enum class RuntimeTarget { Native, Bridge };

struct RuntimeConfig {
  RuntimeTarget target = RuntimeTarget::Native;
  long long chain_id = 0; // 0: read eth_chainId from the node
  std::string rpc_url;
  std::optional<std::string> auth_header;
  std::optional<std::string> private_key;
  // Expected sender; checked against the PRIVATE_KEY address, never substituted for it
  std::optional<std::string> wallet_address;
  std::string bridge_url;
  int rpc_timeout_ms = 3000;
  int receipt_timeout_ms = 60000;
  int receipt_poll_ms = 1000;
};

// Loads runtime configuration from ConfigManager keys:
// RUNTIME_TARGET (native|bridge), CHAIN_ID, RPC_URL, RPC_AUTH_HEADER, PRIVATE_KEY,
// WALLET_ADDRESS, BRIDGE_URL, RPC_TIMEOUT_MS, RECEIPT_TIMEOUT_MS, RECEIPT_POLL_MS.
// Throws std::runtime_error when a key required by the selected target is missing.
RuntimeConfig LoadRuntimeConfig();

// Throws std::runtime_error when WALLET_ADDRESS is set and is not the address
// the signing key derives to.
void CheckWalletAddress(const RuntimeConfig& cfg, const std::string& key_address);

std::string ToString(RuntimeTarget target);

#pragma once

class RpcClient;

struct GasQuote { unsigned long long max_fee_per_gas; unsigned long long max_priority_fee_per_gas; };

struct GasOptions {
  unsigned base_fee_multiplier = 2;
  // Used when the node does not implement eth_maxPriorityFeePerGas
  unsigned long long fallback_priority_fee_wei = 1'500'000'000ULL;
  // 0 leaves the max fee uncapped
  unsigned long long max_fee_cap_wei = 0;
};

// EIP-1559 fee quote: multiplier x latest base fee + node-suggested priority fee,
// clamped to max_fee_cap_wei when one is set.
class GasStrategy {
public:
  explicit GasStrategy(RpcClient& rpc, const GasOptions& opts = GasOptions()) : rpc_(rpc), opts_(opts) {}
  GasQuote Quote();
private:
  RpcClient& rpc_;
  GasOptions opts_;
};

#include "gas/gas_strategy.hpp"
#include "node_connection/rpc_client.hpp"
#include "numeric/big_int.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

GasQuote GasStrategy::Quote() {
  unsigned long long prio = opts_.fallback_priority_fee_wei;
  try {
    auto p = static_cast<unsigned long long>(BigInts::FromHex(rpc_.EthMaxPriorityFeePerGas()));
    if (p > 0) prio = p;
  } catch (const std::exception& e) {
    Logger::Warning(std::string("eth_maxPriorityFeePerGas unavailable, using default: ") + e.what());
  }
  auto block = rpc_.EthGetBlockByNumber("latest", false);
  if (!block.is_object() || !block.contains("baseFeePerGas") || !block["baseFeePerGas"].is_string())
    throw std::runtime_error("latest block has no baseFeePerGas (pre-London chain?)");
  auto base = static_cast<unsigned long long>(BigInts::FromHex(block["baseFeePerGas"].get<std::string>()));

  unsigned long long max_fee = base * opts_.base_fee_multiplier + prio;
  if (opts_.max_fee_cap_wei > 0 && max_fee > opts_.max_fee_cap_wei) {
    if (base > opts_.max_fee_cap_wei)
      throw std::runtime_error("base fee " + std::to_string(base) + " exceeds GAS_MAX_FEE_WEI " + std::to_string(opts_.max_fee_cap_wei));
    Logger::Warning("max fee " + std::to_string(max_fee) + " capped at " + std::to_string(opts_.max_fee_cap_wei));
    max_fee = opts_.max_fee_cap_wei;
    prio = std::min(prio, max_fee - base);
  }
  Logger::Debug("gas quote base=" + std::to_string(base) + " prio=" + std::to_string(prio) + " max=" + std::to_string(max_fee));
  return GasQuote{ max_fee, prio };
}

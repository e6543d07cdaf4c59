#include "token/token_operations.hpp"
#include "token/local_token_operations.hpp"
#include "bridge/bridge_token_operations.hpp"
#include <stdexcept>

std::unique_ptr<TokenOperations> CreateTokenOperations(RuntimeTarget target,
                                                       const std::string& contract,
                                                       const TokenContext& ctx) {
  if (!ctx.wallet) throw std::invalid_argument("token operations need a wallet context");
  switch (target) {
    case RuntimeTarget::Native:
      if (!ctx.reader || !ctx.writer) throw std::invalid_argument("native target needs a contract reader and writer");
      return std::make_unique<LocalTokenOperations>(contract, *ctx.reader, *ctx.writer, *ctx.wallet);
    case RuntimeTarget::Bridge:
      if (!ctx.bridge) throw std::invalid_argument("bridge target needs a bridge transport");
      return std::make_unique<BridgeTokenOperations>(contract, *ctx.bridge, *ctx.wallet);
  }
  throw std::invalid_argument("unknown runtime target");
}

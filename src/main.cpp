#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "config/runtime_config.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "wallet/signer.hpp"
#include "wallet/nonce_manager.hpp"
#include "gas/gas_strategy.hpp"
#include "numeric/big_int.hpp"
#include "telemetry/structured_logger.hpp"
#include "token/rpc_contract_io.hpp"
#include "token/token_operations.hpp"
#include "bridge/bridge_transport.hpp"
#include "signature/voucher_codec.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static void PrintUsage() {
  std::cout <<
    "usage: tokenops <contract> <command> [args...]\n"
    "  get | balance | balanceOf <addr> | allowance <spender> | allowanceOf <owner> <spender> | totalSupply\n"
    "  setAllowance <spender> <amount> | transfer <to> <amount> | transferFrom <from> <to> <amount>\n"
    "  burn <amount> | claim <amount> | claimTo <addr> <amount> | mint <amount> | mintTo <addr> <amount>\n"
    "  claimCondition | canClaim <qty> [addr] | ineligibility <qty> [addr] | claimerProofs <addr>\n"
    "  generate <to> <qty> [price] [currency] | verify <signed-json> | mintWithSignature <signed-json>\n";
}

static std::optional<std::string> Arg(const std::vector<std::string>& args, size_t i) {
  if (i < args.size()) return args[i];
  return std::nullopt;
}

static const std::string& Need(const std::vector<std::string>& args, size_t i, const char* name) {
  if (i >= args.size()) throw std::invalid_argument(std::string("missing argument <") + name + ">");
  return args[i];
}

static json Run(TokenOperations& ops, const std::string& cmd, const std::vector<std::string>& a) {
  if (cmd == "get") return ops.Get();
  if (cmd == "balance") return ops.Balance();
  if (cmd == "balanceOf") return ops.BalanceOf(Need(a, 0, "addr"));
  if (cmd == "allowance") return ops.Allowance(Need(a, 0, "spender"));
  if (cmd == "allowanceOf") return ops.AllowanceOf(Need(a, 0, "owner"), Need(a, 1, "spender"));
  if (cmd == "totalSupply") return ops.TotalSupply();
  if (cmd == "setAllowance") return ops.SetAllowance(Need(a, 0, "spender"), Need(a, 1, "amount"));
  if (cmd == "transfer") return ops.Transfer(Need(a, 0, "to"), Need(a, 1, "amount"));
  if (cmd == "transferFrom") return ops.TransferFrom(Need(a, 0, "from"), Need(a, 1, "to"), Need(a, 2, "amount"));
  if (cmd == "burn") return ops.Burn(Need(a, 0, "amount"));
  if (cmd == "claim") return ops.Claim(Need(a, 0, "amount"));
  if (cmd == "claimTo") return ops.ClaimTo(Need(a, 0, "addr"), Need(a, 1, "amount"));
  if (cmd == "mint") return ops.Mint(Need(a, 0, "amount"));
  if (cmd == "mintTo") return ops.MintTo(Need(a, 0, "addr"), Need(a, 1, "amount"));
  if (cmd == "claimCondition") return ops.GetActiveClaimCondition();
  if (cmd == "canClaim") return ops.CanClaim(Need(a, 0, "qty"), Arg(a, 1));
  if (cmd == "ineligibility") return ops.GetClaimIneligibilityReasons(Need(a, 0, "qty"), Arg(a, 1));
  if (cmd == "claimerProofs") {
    auto p = ops.GetClaimerProofs(Need(a, 0, "addr"));
    return json{{"address", p.address}, {"proof", p.proof}, {"maxClaimable", p.max_claimable},
                {"price", p.price}, {"currencyAddress", p.currency_address}};
  }
  if (cmd == "generate") {
    auto payload = VoucherCodec::NewMintPayload(Need(a, 0, "to"), Need(a, 1, "qty"));
    if (auto price = Arg(a, 2)) payload.price = *price;
    if (auto currency = Arg(a, 3)) payload.currency_address = *currency;
    return ops.GenerateSignature(payload, ConfigManager::Get("SIGNING_KEY"));
  }
  if (cmd == "verify") return ops.VerifySignature(json::parse(Need(a, 0, "signed-json")).get<Token::SignedPayload>());
  if (cmd == "mintWithSignature")
    return ops.MintWithSignature(json::parse(Need(a, 0, "signed-json")).get<Token::SignedPayload>());
  throw std::invalid_argument("unknown command '" + cmd + "'");
}

int main(int argc, char** argv) {
  if (argc < 3) { PrintUsage(); return 2; }
  const std::string contract = argv[1];
  const std::string command = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  try {
    ConfigManager::Initialize(".env");
    Logger::Initialize(ConfigManager::Get("LOG_FILE").value_or("tokenops.log"),
                       Logger::ParseLevel(ConfigManager::Get("LOG_LEVEL").value_or("INFO")),
                       ConfigManager::GetBoolOr("LOG_STDERR", false));
    if (auto metrics = ConfigManager::Get("METRICS_FILE")) StructuredLogger::Instance().Initialize(*metrics);

    RuntimeConfig cfg = LoadRuntimeConfig();
    Logger::Info("tokenops " + command + " on " + contract + " target=" + ToString(cfg.target));
    StructuredLogger::Instance().SetContext({{"contract", contract}, {"target", ToString(cfg.target)}, {"command", command}});

    HttpClientTuning tuning;
    tuning.verify_tls = ConfigManager::GetBoolOr("VERIFY_TLS", true);
    tuning.connect_timeout_ms = ConfigManager::GetIntOr("CONNECT_TIMEOUT_MS", tuning.connect_timeout_ms);
    std::unique_ptr<HttpClient> http(CreateCurlHttpClient(tuning));

    json out;
    if (cfg.target == RuntimeTarget::Bridge) {
      HttpBridgeTransport bridge(*http, cfg.bridge_url);
      BridgeWalletContext wallet(bridge);
      TokenContext ctx;
      ctx.bridge = &bridge;
      ctx.wallet = &wallet;
      auto ops = CreateTokenOperations(cfg.target, contract, ctx);
      out = Run(*ops, command, args);
    } else {
      if (!cfg.private_key) throw std::runtime_error("PRIVATE_KEY is required on the native target");
      RpcClient rpc(*http, cfg.rpc_url, cfg.auth_header);
      Signer signer(*cfg.private_key);
      CheckWalletAddress(cfg, signer.Address());
      NonceManager nonce(rpc, signer.Address());
      GasOptions gopts;
      gopts.base_fee_multiplier = static_cast<unsigned>(ConfigManager::GetIntOr("GAS_BASE_FEE_MULTIPLIER", 2));
      gopts.fallback_priority_fee_wei = static_cast<unsigned long long>(ConfigManager::GetInt64Or("GAS_PRIORITY_FEE_WEI", 1500000000LL));
      gopts.max_fee_cap_wei = static_cast<unsigned long long>(ConfigManager::GetInt64Or("GAS_MAX_FEE_WEI", 0));
      GasStrategy gas(rpc, gopts);
      if (cfg.chain_id == 0) {
        cfg.chain_id = static_cast<long long>(BigInts::FromHex(rpc.EthChainId(cfg.rpc_timeout_ms)));
        Logger::Info("chain id from node: " + std::to_string(cfg.chain_id));
      }

      WriterOptions wopts;
      wopts.chain_id = cfg.chain_id;
      wopts.receipt_timeout_ms = cfg.receipt_timeout_ms;
      wopts.receipt_poll_ms = cfg.receipt_poll_ms;
      RpcContractReader reader(rpc);
      RpcContractWriter writer(rpc, signer, nonce, gas, wopts);
      SignerWalletContext wallet(signer, cfg.chain_id);

      TokenContext ctx;
      ctx.reader = &reader;
      ctx.writer = &writer;
      ctx.wallet = &wallet;
      auto ops = CreateTokenOperations(cfg.target, contract, ctx);
      out = Run(*ops, command, args);
    }

    std::cout << out.dump(2) << std::endl;
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return 0;
  } catch (const TokenError& e) {
    std::cerr << e.what() << std::endl;
    Logger::Error(e.what());
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    PrintUsage();
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    Logger::Critical(e.what());
  }
  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
  return 1;
}

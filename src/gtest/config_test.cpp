#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "common/config_manager.hpp"
#include "config/runtime_config.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace {
    std::string WriteEnv(const std::string& body)
    {
        std::string path = ::testing::TempDir() + "tokenops_test.env";
        std::ofstream out(path);
        out << body;
        return path;
    }
}

TEST(config_test, env_file_values_and_fallback)
{
    ::setenv("TOKENOPS_TEST_ONLY_IN_ENV", "from-env", 1);
    ConfigManager::Initialize(WriteEnv("# comment\nRPC_URL = \"http://localhost:8545\"\nCHAIN_ID=137\nVERIFY=yes\n"));
    EXPECT_EQ(ConfigManager::Get("RPC_URL").value_or(""), "http://localhost:8545");
    EXPECT_EQ(ConfigManager::GetInt64Or("CHAIN_ID", 1), 137);
    EXPECT_TRUE(ConfigManager::GetBoolOr("VERIFY", false));
    EXPECT_EQ(ConfigManager::Get("TOKENOPS_TEST_ONLY_IN_ENV").value_or(""), "from-env");
    EXPECT_FALSE(ConfigManager::Get("TOKENOPS_TEST_MISSING").has_value());
    EXPECT_THROW(ConfigManager::GetOrThrow("TOKENOPS_TEST_MISSING"), std::runtime_error);
    ::unsetenv("TOKENOPS_TEST_ONLY_IN_ENV");
}

TEST(config_test, native_runtime)
{
    ::unsetenv("RUNTIME_TARGET");
    ConfigManager::Initialize(WriteEnv("RUNTIME_TARGET=native\nRPC_URL=http://node\nCHAIN_ID=80001\n"
                                       "PRIVATE_KEY=0x01\nRECEIPT_TIMEOUT_MS=5000\n"));
    auto cfg = LoadRuntimeConfig();
    EXPECT_EQ(cfg.target, RuntimeTarget::Native);
    EXPECT_EQ(cfg.rpc_url, "http://node");
    EXPECT_EQ(cfg.chain_id, 80001);
    EXPECT_EQ(cfg.private_key.value_or(""), "0x01");
    EXPECT_EQ(cfg.receipt_timeout_ms, 5000);
    EXPECT_EQ(ToString(cfg.target), "native");
}

TEST(config_test, bridge_runtime_requires_bridge_url)
{
    ::unsetenv("BRIDGE_URL");
    ConfigManager::Initialize(WriteEnv("RUNTIME_TARGET=bridge\n"));
    EXPECT_THROW(LoadRuntimeConfig(), std::runtime_error);

    ConfigManager::Initialize(WriteEnv("RUNTIME_TARGET=bridge\nBRIDGE_URL=http://127.0.0.1:9000/invoke\n"));
    auto cfg = LoadRuntimeConfig();
    EXPECT_EQ(cfg.target, RuntimeTarget::Bridge);
    EXPECT_EQ(cfg.bridge_url, "http://127.0.0.1:9000/invoke");

    ConfigManager::Initialize(WriteEnv("RUNTIME_TARGET=webgl\n"));
    EXPECT_THROW(LoadRuntimeConfig(), std::runtime_error);
}

TEST(config_test, native_runtime_chain_id_defaults_to_node)
{
    ::unsetenv("CHAIN_ID");
    ::unsetenv("RUNTIME_TARGET");
    ConfigManager::Initialize(WriteEnv("RPC_URL=http://node\n"));
    EXPECT_EQ(LoadRuntimeConfig().chain_id, 0);
}

TEST(structured_logger_test, events_carry_context)
{
    std::string path = ::testing::TempDir() + "tokenops_events.jsonl";
    std::remove(path.c_str());
    auto& events = StructuredLogger::Instance();
    events.Initialize(path);
    events.SetContext({{"contract", "0xabc"}, {"target", "native"}});
    events.LogEvent("tx_submitted", {{"tx_hash", "0x01"}, {"target", "override"}});
    events.Shutdown();
    events.SetContext(nlohmann::json::object());

    std::ifstream in(path);
    std::vector<nlohmann::json> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(nlohmann::json::parse(line));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["event"].get<std::string>(), "tx_submitted");
    EXPECT_EQ(lines[0]["contract"].get<std::string>(), "0xabc");
    EXPECT_EQ(lines[0]["target"].get<std::string>(), "override");
    EXPECT_TRUE(lines[0].contains("ts_ms"));

    // stopped sink drops events
    events.LogEvent("tx_receipt", {});
}

TEST(config_test, integers_must_parse_completely)
{
    ConfigManager::Initialize(WriteEnv("RPC_TIMEOUT_MS=2500ms\nCHAIN_ID=17e8\nRECEIPT_POLL_MS=250\nBIG=99999999999\n"));
    EXPECT_EQ(ConfigManager::GetIntOr("RPC_TIMEOUT_MS", 3000), 3000);
    EXPECT_EQ(ConfigManager::GetInt64Or("CHAIN_ID", 1), 1);
    EXPECT_EQ(ConfigManager::GetIntOr("RECEIPT_POLL_MS", 1000), 250);
    EXPECT_EQ(ConfigManager::GetIntOr("BIG", 7), 7);
    EXPECT_EQ(ConfigManager::GetInt64Or("BIG", 7), 99999999999LL);
}

TEST(config_test, wallet_address_must_match_signing_key)
{
    const std::string key_address = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf";
    RuntimeConfig cfg;
    EXPECT_NO_THROW(CheckWalletAddress(cfg, key_address));

    // EIP-55 checksummed form of the same account
    cfg.wallet_address = std::string("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
    EXPECT_NO_THROW(CheckWalletAddress(cfg, key_address));

    cfg.wallet_address = std::string("0xabcabcabcabcabcabcabcabcabcabcabcabcabca");
    EXPECT_THROW(CheckWalletAddress(cfg, key_address), std::runtime_error);
}

TEST(config_test, wallet_address_is_loaded_for_checking)
{
    ::unsetenv("RUNTIME_TARGET");
    ::unsetenv("WALLET_ADDRESS");
    ConfigManager::Initialize(WriteEnv("RPC_URL=http://node\nPRIVATE_KEY=0x01\nWALLET_ADDRESS=0xabcabcabcabcabcabcabcabcabcabcabcabcabca\n"));
    auto cfg = LoadRuntimeConfig();
    ASSERT_TRUE(cfg.wallet_address.has_value());
    EXPECT_THROW(CheckWalletAddress(cfg, "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"), std::runtime_error);
}

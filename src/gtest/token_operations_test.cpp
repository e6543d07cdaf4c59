#include <gtest/gtest.h>
#include "token/local_token_operations.hpp"
#include "token/token_operations.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include "fakes.hpp"

namespace {
    std::string Word(const std::string& calldata, size_t i)
    {
        return calldata.substr(10 + i * 64, 64);
    }

    class token_operations_test : public ::testing::Test {
    protected:
        FakeReader reader;
        FakeWriter writer;
        FakeWallet wallet{kTestKey, 137};
        LocalTokenOperations ops{kTokenAddress, reader, writer, wallet};

        void SetUp() override
        {
            reader.Set(kTokenAddress, "name()", AbiResult::String("Game Gold"));
            reader.Set(kTokenAddress, "symbol()", AbiResult::String("GOLD"));
            reader.Set(kTokenAddress, "decimals()", AbiResult::Word(6));
        }

        void SetCondition(const BigInt& price, const std::string& currency)
        {
            reader.Set(kTokenAddress, "getActiveClaimConditionId()", AbiResult::Word(0));
            reader.Set(kTokenAddress, "getClaimConditionById(uint256)",
                       AbiResult::ClaimCondition(0, 1000000, 0, 100, price, currency));
        }
    };
}

TEST_F(token_operations_test, get_currency)
{
    auto c = ops.Get();
    EXPECT_EQ(c.name, "Game Gold");
    EXPECT_EQ(c.symbol, "GOLD");
    EXPECT_EQ(c.decimals, 6);
}

TEST_F(token_operations_test, balance_reads_wallet_address)
{
    reader.Set(kTokenAddress, "balanceOf(address)", AbiResult::Word(BigInt("1234567891234")));
    auto v = ops.Balance();
    EXPECT_EQ(v.value, "1234567891234");
    EXPECT_EQ(v.display_value, "1,234,567.8912");
    EXPECT_EQ(v.symbol, "GOLD");
    EXPECT_EQ(v.decimals, 6);

    const auto& call = reader.calls.back().second;
    EXPECT_EQ(call.substr(0, 10), "0x70a08231");
    EXPECT_EQ(Word(call, 0), std::string(24, '0') + std::string(kTestKeyAddress).substr(2));
}

TEST_F(token_operations_test, allowance_and_total_supply)
{
    reader.Set(kTokenAddress, "allowance(address,address)", AbiResult::Word(500000));
    reader.Set(kTokenAddress, "totalSupply()", AbiResult::Word(BigInt(21000000) * BigInts::Pow10(6)));
    EXPECT_EQ(ops.AllowanceOf(kReceiver, kCurrencyAddress).display_value, "0.5");
    EXPECT_EQ(ops.Allowance(kCurrencyAddress).value, "500000");
    EXPECT_EQ(ops.TotalSupply().display_value, "21,000,000");
}

TEST_F(token_operations_test, transfer_converts_with_token_decimals)
{
    auto res = ops.Transfer(kReceiver, "1.5");
    EXPECT_EQ(res.status, Token::TransactionStatus::Confirmed);
    ASSERT_EQ(writer.sent.size(), 1u);
    const auto& tx = writer.sent[0];
    EXPECT_EQ(tx.address, kTokenAddress);
    EXPECT_EQ(tx.calldata.substr(0, 10), "0xa9059cbb");
    EXPECT_EQ(BigInts::FromHex(Word(tx.calldata, 1)), BigInt(1500000));
    EXPECT_EQ(tx.value, BigInt(0));
}

TEST_F(token_operations_test, other_writes_convert_amounts)
{
    ops.TransferFrom(kReceiver, kCurrencyAddress, "2");
    ops.Burn("0.000001");
    ops.MintTo(kReceiver, "10");
    ops.SetAllowance(kCurrencyAddress, "0.25");
    ops.Mint("1");
    ASSERT_EQ(writer.sent.size(), 5u);

    EXPECT_EQ(writer.sent[0].calldata.substr(0, 10), "0x23b872dd");
    EXPECT_EQ(BigInts::FromHex(Word(writer.sent[0].calldata, 2)), BigInt(2000000));
    EXPECT_EQ(writer.sent[1].calldata.substr(0, 10), "0x42966c68");
    EXPECT_EQ(BigInts::FromHex(Word(writer.sent[1].calldata, 0)), BigInt(1));
    EXPECT_EQ(writer.sent[2].calldata.substr(0, 10), "0x449a52f8");
    EXPECT_EQ(BigInts::FromHex(Word(writer.sent[2].calldata, 1)), BigInt(10000000));
    EXPECT_EQ(writer.sent[3].calldata.substr(0, 10), "0x095ea7b3");
    EXPECT_EQ(BigInts::FromHex(Word(writer.sent[3].calldata, 1)), BigInt(250000));
    // mint() goes to the connected wallet
    EXPECT_EQ(Word(writer.sent[4].calldata, 0), std::string(24, '0') + std::string(kTestKeyAddress).substr(2));
}

TEST_F(token_operations_test, malformed_amount_is_rejected_before_submission)
{
    EXPECT_THROW(ops.Transfer(kReceiver, "1e3"), ParseError);
    EXPECT_THROW(ops.Burn("-1"), ParseError);
    EXPECT_TRUE(writer.sent.empty());
}

TEST_F(token_operations_test, native_claim_pays_quantity_times_price)
{
    BigInt price = BigInt(2) * BigInts::Pow10(16);
    SetCondition(price, Token::kNativeTokenAddress);
    ops.Claim("3");
    ASSERT_EQ(writer.sent.size(), 1u);
    const auto& tx = writer.sent[0];
    EXPECT_EQ(tx.calldata.substr(0, 10), "0x84bb1e42");
    EXPECT_EQ(Word(tx.calldata, 0), std::string(24, '0') + std::string(kTestKeyAddress).substr(2));
    // quantity in token decimals, price as stored on the condition
    EXPECT_EQ(BigInts::FromHex(Word(tx.calldata, 1)), BigInt(3000000));
    EXPECT_EQ(BigInts::FromHex(Word(tx.calldata, 3)), price);
    EXPECT_EQ(tx.value, BigInt(3) * price);
}

TEST_F(token_operations_test, fractional_native_claim)
{
    SetCondition(BigInt(2) * BigInts::Pow10(16), Token::kNativeTokenAddress);
    ops.ClaimTo(kReceiver, "1.5");
    ASSERT_EQ(writer.sent.size(), 1u);
    EXPECT_EQ(writer.sent[0].value, BigInt(3) * BigInts::Pow10(16));
    EXPECT_EQ(BigInts::FromHex(Word(writer.sent[0].calldata, 1)), BigInt(1500000));
}

TEST_F(token_operations_test, erc20_claim_sends_no_value)
{
    SetCondition(BigInt(5) * BigInts::Pow10(6), kCurrencyAddress);
    reader.Set(kCurrencyAddress, "name()", AbiResult::String("USD Coin"));
    reader.Set(kCurrencyAddress, "symbol()", AbiResult::String("USDC"));
    reader.Set(kCurrencyAddress, "decimals()", AbiResult::Word(6));
    ops.ClaimTo(kReceiver, "4");
    ASSERT_EQ(writer.sent.size(), 1u);
    EXPECT_EQ(writer.sent[0].value, BigInt(0));
    // allowlist proof carries the per-wallet limit and price
    EXPECT_EQ(BigInts::FromHex(Word(writer.sent[0].calldata, 7)), BigInt(100));
    EXPECT_EQ(BigInts::FromHex(Word(writer.sent[0].calldata, 8)), BigInt(5000000));
}

TEST_F(token_operations_test, active_claim_condition)
{
    SetCondition(0, kCurrencyAddress);
    reader.Fail(kCurrencyAddress);
    auto c = ops.GetActiveClaimCondition();
    EXPECT_EQ(c.available_supply, "1000000");
    EXPECT_EQ(c.max_claimable_per_wallet, "100");
}

TEST_F(token_operations_test, allowlist_queries_unsupported)
{
    EXPECT_THROW(ops.CanClaim("1", std::nullopt), UnsupportedOperation);
    EXPECT_THROW(ops.GetClaimIneligibilityReasons("1", std::string(kReceiver)), UnsupportedOperation);
    EXPECT_THROW(ops.GetClaimerProofs(kReceiver), UnsupportedOperation);
}

TEST_F(token_operations_test, signature_mint_round_trip)
{
    reader.Set(kTokenAddress, "primarySaleRecipient()", AbiResult::Address(kTestKeyAddress));
    reader.Set(kTokenAddress, "verify((address,address,uint256,uint256,address,uint128,uint128,bytes32),bytes)",
               AbiResult::BoolAndAddress(true, kTestKeyAddress));

    Token::MintPayload p;
    p.to = kReceiver;
    p.quantity = "2.5";
    p.uid = "0x" + std::string(64, '7');
    p.mint_start_time = 1700000000;
    p.mint_end_time = 2000000000;

    auto sp = ops.GenerateSignature(p, std::nullopt);
    EXPECT_EQ(sp.payload.quantity, "2500000000000000000");
    EXPECT_EQ(sp.payload.primary_sale_recipient, kTestKeyAddress);
    EXPECT_TRUE(ops.VerifySignature(sp));

    auto res = ops.MintWithSignature(sp);
    EXPECT_EQ(res.status, Token::TransactionStatus::Confirmed);
    ASSERT_EQ(writer.sent.size(), 1u);
    EXPECT_EQ(writer.sent[0].calldata.substr(0, 10), "0x8f0fefbb");
    EXPECT_EQ(writer.sent[0].value, 0);
}

TEST(local_claim_value_test, whole_quantities_are_exact)
{
    Token::ClaimCondition c;
    c.currency_address = Token::kNativeTokenAddress;
    c.currency_metadata.value = "123456789123456789";
    for (int q = 0; q < 20; ++q) {
        EXPECT_EQ(LocalTokenOperations::ClaimValue(c, std::to_string(q)), BigInt(q) * BigInt("123456789123456789"));
    }
    c.currency_address = kCurrencyAddress;
    EXPECT_EQ(LocalTokenOperations::ClaimValue(c, "5"), BigInt(0));
}

TEST(token_operations_factory_test, picks_implementation_by_target)
{
    FakeReader reader;
    FakeWriter writer;
    FakeWallet wallet(kTestKey);
    FakeBridge bridge;

    TokenContext native;
    native.reader = &reader;
    native.writer = &writer;
    native.wallet = &wallet;
    auto local = CreateTokenOperations(RuntimeTarget::Native, kTokenAddress, native);
    EXPECT_NE(dynamic_cast<LocalTokenOperations*>(local.get()), nullptr);

    TokenContext remote;
    remote.bridge = &bridge;
    remote.wallet = &wallet;
    auto bridged = CreateTokenOperations(RuntimeTarget::Bridge, kTokenAddress, remote);
    bridge.Set(std::string(kTokenAddress) + "/erc20/get", {{"name", "Game Gold"}, {"symbol", "GOLD"}, {"decimals", "6"}});
    EXPECT_EQ(bridged->Get().decimals, 6);
    EXPECT_TRUE(reader.calls.empty());

    TokenContext missing;
    missing.wallet = &wallet;
    EXPECT_THROW(CreateTokenOperations(RuntimeTarget::Native, kTokenAddress, missing), std::invalid_argument);
    EXPECT_THROW(CreateTokenOperations(RuntimeTarget::Bridge, kTokenAddress, missing), std::invalid_argument);
}

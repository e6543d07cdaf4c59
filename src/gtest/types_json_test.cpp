#include <gtest/gtest.h>
#include "token/types.hpp"
#include "common/errors.hpp"
#include "fakes.hpp"

using json = nlohmann::json;

TEST(types_json_test, currency_value_uses_camel_case)
{
    Token::Currency c{"USD Coin", "USDC", 6};
    auto v = Token::MakeCurrencyValue(c, BigInt(1234567));
    json j = v;
    EXPECT_EQ(j["displayValue"], "1.2345");
    EXPECT_EQ(j["decimals"], "6");
    EXPECT_EQ(j["value"], "1234567");

    auto back = j.get<Token::CurrencyValue>();
    EXPECT_EQ(back.decimals, 6);
    EXPECT_EQ(back.display_value, "1.2345");
}

TEST(types_json_test, decimals_accepts_number_or_string)
{
    EXPECT_EQ(json({{"name", "A"}, {"symbol", "A"}, {"decimals", 8}}).get<Token::Currency>().decimals, 8);
    EXPECT_EQ(json({{"name", "A"}, {"symbol", "A"}, {"decimals", "8"}}).get<Token::Currency>().decimals, 8);
    EXPECT_EQ(json({{"name", "A"}}).get<Token::Currency>().decimals, 18);
    EXPECT_THROW(json({{"decimals", "eight"}}).get<Token::Currency>(), ParseError);
}

TEST(types_json_test, mint_payload_defaults)
{
    auto p = json({{"to", kReceiver}, {"quantity", "1"}}).get<Token::MintPayload>();
    EXPECT_EQ(p.price, "0");
    EXPECT_EQ(p.currency_address, Token::kZeroAddress);
    EXPECT_EQ(p.primary_sale_recipient, Token::kZeroAddress);

    json j = p;
    EXPECT_TRUE(j.contains("primarySaleRecipient"));
    EXPECT_TRUE(j.contains("mintStartTime"));
}

TEST(types_json_test, signed_payload_requires_payload)
{
    EXPECT_THROW(json({{"signature", "0x00"}}).get<Token::SignedPayload>(), ParseError);
}

TEST(types_json_test, transaction_result_shapes)
{
    Token::TransactionResult r;
    r.status = Token::TransactionStatus::Reverted;
    r.tx_hash = "0x01";
    r.receipt = "{\"status\":\"0x0\"}";
    json j = r;
    EXPECT_EQ(j["status"], "reverted");
    EXPECT_EQ(j["hash"], "0x01");
    EXPECT_EQ(j["receipt"]["status"], "0x0");

    auto mined = json({{"receipt", {{"transactionHash", "0x02"}, {"status", "0x0"}}}}).get<Token::TransactionResult>();
    EXPECT_EQ(mined.status, Token::TransactionStatus::Reverted);
    EXPECT_EQ(mined.tx_hash, "0x02");

    auto pending = json::object().get<Token::TransactionResult>();
    EXPECT_EQ(pending.status, Token::TransactionStatus::Pending);
    EXPECT_THROW(json({{"status", "lost"}}).get<Token::TransactionResult>(), ParseError);
}

TEST(types_json_test, native_token_sentinel_any_case)
{
    EXPECT_TRUE(Token::IsNativeToken("0xeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeee"));
    EXPECT_TRUE(Token::IsNativeToken(Token::kNativeTokenAddress));
    EXPECT_FALSE(Token::IsNativeToken(Token::kZeroAddress));
}

TEST(types_json_test, timestamps_reject_partial_integers)
{
    json j = {{"to", kReceiver}, {"quantity", "1"}, {"mintStartTime", "1700000000"}, {"mintEndTime", 2000000000}};
    auto p = j.get<Token::MintPayload>();
    EXPECT_EQ(p.mint_start_time, 1700000000);
    EXPECT_EQ(p.mint_end_time, 2000000000);

    for (const char* bad : {"17e8", "1.5", "1700000000.5", "137abc", " 17", ""}) {
        j["mintStartTime"] = bad;
        EXPECT_THROW(j.get<Token::MintPayload>(), ParseError) << bad;
    }
    j["mintStartTime"] = 1.5;
    EXPECT_THROW(j.get<Token::MintPayload>(), ParseError);
}

TEST(types_json_test, signed_payload_output_rejects_partial_integers)
{
    json j = {{"signature", "0x" + std::string(130, '1')},
              {"payload", {{"to", kReceiver}, {"quantity", "1"}, {"mintStartTime", "0"}, {"mintEndTime", "17e8"}}}};
    EXPECT_THROW(j.get<Token::SignedPayload>(), ParseError);
}

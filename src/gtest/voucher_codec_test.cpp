#include <gtest/gtest.h>
#include <chrono>
#include "signature/voucher_codec.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include "fakes.hpp"

namespace {
    Token::MintPayload Payload()
    {
        Token::MintPayload p;
        p.to = "0xAbcAbcAbcAbcAbcAbcAbcAbcAbcAbcAbcAbcAbcA";
        p.quantity = "10";
        p.price = "0";
        p.uid = "0x" + std::string(64, '7');
        p.mint_start_time = 1700000000;
        p.mint_end_time = 2000000000;
        return p;
    }
}

TEST(voucher_codec_test, quantity_uses_18_decimals)
{
    auto req = VoucherCodec::BuildMintRequest(Payload(), kTokenAddress);
    EXPECT_EQ(req.quantity, BigInt(10) * BigInts::Pow10(18));
    EXPECT_EQ(req.price, BigInt(0));
    EXPECT_EQ(req.to, "0xAbcAbcAbcAbcAbcAbcAbcAbcAbcAbcAbcAbcAbcA");
    EXPECT_EQ(req.primary_sale_recipient, kTokenAddress);
    EXPECT_EQ(req.currency, Token::kZeroAddress);
    EXPECT_EQ(req.validity_start_timestamp, BigInt(1700000000));
    EXPECT_EQ(req.validity_end_timestamp, BigInt(2000000000));
    EXPECT_EQ(req.uid, std::vector<unsigned char>(32, 0x77));
}

TEST(voucher_codec_test, fractional_price)
{
    auto p = Payload();
    p.price = "0.01";
    p.currency_address = Token::kNativeTokenAddress;
    auto req = VoucherCodec::BuildMintRequest(p, kTokenAddress);
    EXPECT_EQ(req.price, BigInts::Pow10(16));
    EXPECT_EQ(req.currency, Token::kNativeTokenAddress);
}

TEST(voucher_codec_test, malformed_input)
{
    auto p = Payload();
    p.uid = "0x1234";
    EXPECT_THROW(VoucherCodec::BuildMintRequest(p, kTokenAddress), ParseError);
    p = Payload();
    p.uid = "0x" + std::string(64, 'g');
    EXPECT_THROW(VoucherCodec::BuildMintRequest(p, kTokenAddress), ParseError);
    p = Payload();
    p.quantity = "-5";
    EXPECT_THROW(VoucherCodec::BuildMintRequest(p, kTokenAddress), ParseError);
    p = Payload();
    p.mint_end_time = -1;
    EXPECT_THROW(VoucherCodec::BuildMintRequest(p, kTokenAddress), ParseError);
}

TEST(voucher_codec_test, new_payload_defaults)
{
    auto before = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto p = VoucherCodec::NewMintPayload(kReceiver, "5");
    EXPECT_EQ(p.to, kReceiver);
    EXPECT_EQ(p.quantity, "5");
    EXPECT_EQ(p.price, "0");
    EXPECT_EQ(p.currency_address, Token::kZeroAddress);
    EXPECT_EQ(p.primary_sale_recipient, Token::kZeroAddress);
    EXPECT_EQ(p.uid.size(), 66u);
    EXPECT_GE(p.mint_start_time, before);
    EXPECT_LE(p.mint_start_time, before + 5);
    EXPECT_EQ(p.mint_end_time - p.mint_start_time, VoucherCodec::kDefaultValiditySeconds);

    auto q = VoucherCodec::NewMintPayload(kReceiver, "5");
    EXPECT_NE(p.uid, q.uid);
}

TEST(voucher_codec_test, signed_output_carries_integers)
{
    auto req = VoucherCodec::BuildMintRequest(Payload(), kTokenAddress);
    auto out = VoucherCodec::ToSignedPayloadOutput(req);
    EXPECT_EQ(out.quantity, "10000000000000000000");
    EXPECT_EQ(out.price, "0");
    EXPECT_EQ(out.uid, "0x" + std::string(64, '7'));
    EXPECT_EQ(out.mint_start_time, 1700000000);
    EXPECT_EQ(out.primary_sale_recipient, kTokenAddress);

    auto back = VoucherCodec::RequestFromSignedPayload(out);
    EXPECT_EQ(back.quantity, req.quantity);
    EXPECT_EQ(back.uid, req.uid);
    EXPECT_EQ(back.validity_end_timestamp, req.validity_end_timestamp);

    out.quantity = "1.5";
    EXPECT_THROW(VoucherCodec::RequestFromSignedPayload(out), ParseError);
}

#include <gtest/gtest.h>
#include "signature/typed_data_signer.hpp"
#include "signature/voucher_codec.hpp"
#include "wallet/signer.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include "fakes.hpp"

namespace {
    const char* kSaleRecipient = "0x3333333333333333333333333333333333333333";
    const char* kOtherKey = "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";

    class typed_data_signer_test : public ::testing::Test {
    protected:
        FakeReader reader;
        FakeWriter writer;
        FakeWallet wallet{kTestKey, 137};
        TypedDataSigner signer{reader, writer, wallet, kTokenAddress};

        void SetUp() override
        {
            reader.Set(kTokenAddress, "name()", AbiResult::String("Test Token"));
            reader.Set(kTokenAddress, "primarySaleRecipient()", AbiResult::Address(kSaleRecipient));
            ContractSees(true, kTestKeyAddress);
        }

        void ContractSees(bool ok, const std::string& who)
        {
            reader.Set(kTokenAddress, std::string("verify(") + TokenERC20Tuple() + ",bytes)", AbiResult::BoolAndAddress(ok, who));
        }

        static std::string TokenERC20Tuple()
        {
            return "(address,address,uint256,uint256,address,uint128,uint128,bytes32)";
        }

        static Token::MintPayload Payload()
        {
            Token::MintPayload p;
            p.to = kReceiver;
            p.quantity = "10";
            p.uid = "0x" + std::string(64, '5');
            p.mint_start_time = 1700000000;
            p.mint_end_time = 2000000000;
            return p;
        }
    };
}

TEST_F(typed_data_signer_test, generate_uses_wallet_and_contract_recipient)
{
    auto sp = signer.Generate(Payload());
    EXPECT_EQ(sp.signature.size(), 132u);
    EXPECT_EQ(sp.payload.primary_sale_recipient, kSaleRecipient);
    EXPECT_EQ(sp.payload.quantity, "10000000000000000000");
    EXPECT_EQ(TypedDataSigner::RecoverSigner(sp, signer.ResolveDomain()), kTestKeyAddress);
    auto v = HexToBytes(sp.signature)[64];
    EXPECT_TRUE(v == 27 || v == 28);
}

TEST_F(typed_data_signer_test, generate_is_deterministic_and_verifies)
{
    auto a = signer.Generate(Payload());
    auto b = signer.Generate(Payload());
    EXPECT_EQ(a.signature, b.signature);
    EXPECT_TRUE(signer.Verify(a));
    EXPECT_TRUE(signer.Verify(b));
}

TEST_F(typed_data_signer_test, explicit_key_overrides_wallet)
{
    auto sp = signer.Generate(Payload(), std::string(kOtherKey));
    EXPECT_EQ(TypedDataSigner::RecoverSigner(sp, signer.ResolveDomain()), Signer(kOtherKey).Address());
    // contract still reports the wallet as signer
    EXPECT_FALSE(signer.Verify(sp));
}

TEST_F(typed_data_signer_test, payload_recipient_is_not_overwritten)
{
    auto p = Payload();
    p.primary_sale_recipient = kCurrencyAddress;
    auto sp = signer.Generate(p);
    EXPECT_EQ(sp.payload.primary_sale_recipient, kCurrencyAddress);
}

TEST_F(typed_data_signer_test, tampering_breaks_verification)
{
    auto sp = signer.Generate(Payload());
    auto domain = signer.ResolveDomain();

    auto uid = sp;
    uid.payload.uid[5] = uid.payload.uid[5] == '5' ? '6' : '5';
    EXPECT_NE(TypedDataSigner::RecoverSigner(uid, domain), kTestKeyAddress);
    EXPECT_FALSE(signer.Verify(uid));

    auto qty = sp;
    qty.payload.quantity = "10000000000000000001";
    EXPECT_NE(TypedDataSigner::RecoverSigner(qty, domain), kTestKeyAddress);
    EXPECT_FALSE(signer.Verify(qty));

    auto to = sp;
    to.payload.to = kCurrencyAddress;
    EXPECT_NE(TypedDataSigner::RecoverSigner(to, domain), kTestKeyAddress);
    EXPECT_FALSE(signer.Verify(to));
}

TEST_F(typed_data_signer_test, verify_defers_to_contract)
{
    auto sp = signer.Generate(Payload());
    ContractSees(false, kTestKeyAddress);
    EXPECT_FALSE(signer.Verify(sp));
}

TEST_F(typed_data_signer_test, verify_rejects_unrecoverable_signature)
{
    auto sp = signer.Generate(Payload());
    sp.signature = "0x" + std::string(128, '0') + "1b";
    EXPECT_FALSE(signer.Verify(sp));
}

TEST_F(typed_data_signer_test, mint_native_pays_quantity_times_price)
{
    auto p = Payload();
    p.quantity = "3";
    p.price = "0.5";
    p.currency_address = Token::kNativeTokenAddress;
    auto sp = signer.Generate(p);

    auto res = signer.Mint(sp);
    EXPECT_EQ(res.status, Token::TransactionStatus::Confirmed);
    ASSERT_EQ(writer.sent.size(), 1u);
    EXPECT_EQ(writer.sent[0].address, kTokenAddress);
    EXPECT_EQ(writer.sent[0].calldata.substr(0, 10), "0x8f0fefbb");
    EXPECT_EQ(writer.sent[0].value, BigInt(15) * BigInts::Pow10(17));
}

TEST_F(typed_data_signer_test, mint_erc20_currency_sends_no_value)
{
    auto p = Payload();
    p.price = "2";
    p.currency_address = kCurrencyAddress;
    signer.Mint(signer.Generate(p));
    ASSERT_EQ(writer.sent.size(), 1u);
    EXPECT_EQ(writer.sent[0].value, BigInt(0));
}

TEST_F(typed_data_signer_test, mint_signer_mismatch)
{
    auto sp = signer.Generate(Payload());
    ContractSees(false, kCurrencyAddress);
    EXPECT_THROW(signer.Mint(sp), SignatureMismatch);

    sp.signature = "0x" + std::string(128, '0') + "1b";
    EXPECT_THROW(signer.Mint(sp), SignatureMismatch);
    EXPECT_TRUE(writer.sent.empty());
}

TEST(typed_data_signer_payable_test, integer_arithmetic)
{
    Token::MintRequest req;
    req.currency = Token::kNativeTokenAddress;
    req.quantity = BigInt(7) * BigInts::Pow10(18);
    req.price = BigInt(3) * BigInts::Pow10(15);
    EXPECT_EQ(TypedDataSigner::PayableValue(req), BigInt(21) * BigInts::Pow10(15));
    req.currency = kCurrencyAddress;
    EXPECT_EQ(TypedDataSigner::PayableValue(req), BigInt(0));
}

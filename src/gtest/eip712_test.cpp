#include <gtest/gtest.h>
#include "signature/eip712.hpp"
#include "utils/hex.hpp"
#include "fakes.hpp"

namespace {
    EIP712::Domain TestDomain()
    {
        EIP712::Domain d;
        d.name = "Test Token";
        d.version = "1";
        d.chain_id = 137;
        d.verifying_contract = kTokenAddress;
        return d;
    }

    Token::MintRequest TestRequest()
    {
        Token::MintRequest req;
        req.to = kReceiver;
        req.primary_sale_recipient = "0x3333333333333333333333333333333333333333";
        req.quantity = BigInt(10) * BigInts::Pow10(18);
        req.price = 0;
        req.currency = Token::kZeroAddress;
        req.validity_start_timestamp = 1700000000;
        req.validity_end_timestamp = 2000000000;
        req.uid.assign(32, 0x01);
        return req;
    }
}

TEST(eip712_test, type_hashes)
{
    EXPECT_EQ(BytesToHex0x(EIP712::TypeHash(EIP712::kDomainType)),
              "0x8b73c3c69bb8fe3d512ecc4cf759cc79239f7b179b0ffacaa9a75d522b39400f");
    EXPECT_EQ(BytesToHex0x(EIP712::TypeHash(EIP712::kMintRequestType)),
              "0xbac245dbd9b8b2bb334c0675db20a7a7a8506de563990c4ce3207f4c3c5b75e1");
}

TEST(eip712_test, domain_separator)
{
    EXPECT_EQ(BytesToHex0x(EIP712::DomainSeparator(TestDomain())),
              "0xbf20aff18d4edc8654fcecd5829acd2271fc13af48a15358313783c5dcd4c438");
}

TEST(eip712_test, struct_hash_and_digest)
{
    EXPECT_EQ(BytesToHex0x(EIP712::StructHash(TestRequest())),
              "0x5ac9befb873b7d7f9cef9a82e335c555be44333dfa442e29ada0a69357b06e7a");
    EXPECT_EQ(BytesToHex0x(EIP712::Digest(TestDomain(), TestRequest())),
              "0xec22ec5ca1206abd76956ae0621ebdd7fc84fb47e05abd0fe8aa66042d7b98da");
}

TEST(eip712_test, digest_depends_on_every_domain_field)
{
    auto base = EIP712::Digest(TestDomain(), TestRequest());
    auto d = TestDomain();
    d.chain_id = 1;
    EXPECT_NE(EIP712::Digest(d, TestRequest()), base);
    d = TestDomain();
    d.version = "2";
    EXPECT_NE(EIP712::Digest(d, TestRequest()), base);
    d = TestDomain();
    d.verifying_contract = kCurrencyAddress;
    EXPECT_NE(EIP712::Digest(d, TestRequest()), base);
}

TEST(eip712_test, address_case_does_not_change_hash)
{
    auto req = TestRequest();
    req.to = "0xABCABCABCABCABCABCABCABCABCABCABCABCABCA";
    EXPECT_EQ(EIP712::StructHash(req), EIP712::StructHash(TestRequest()));
}
